#ifndef INCLUDE_FRAGMENT_VALIDATOR_H_
#define INCLUDE_FRAGMENT_VALIDATOR_H_

#include <cstdint>
#include <string>
#include <vector>

#include "reassembly/validation.h"

namespace Seastitch {

/**
 * Checks that the selected, repaired fragments of one file have the sizes and
 * count the transfer implies.
 *
 * Gaps in the fragment sequence and non-final fragments of the wrong size
 * make the outcome not-ok, each with a resend hint. Warnings about the final
 * fragment carry a hint but leave the outcome ok. When the total size is
 * known a mismatch of the summed sizes makes the outcome not-ok, with no hint.
 * A fragment count that differs from the expected count is only logged.
 *
 * @param defrag_file    Path of the reassembled file the fragments make up
 * @param fragments      Fragments in slot order, path pointing at repaired bytes
 * @param fragment_size  Fragment size for the dive; validation is skipped when not positive
 * @param sizes          Expected/received sizes per transmitted fragment name
 * @param total_size     Size of the whole file, 0 when unknown
 */
ValidationOutcome ValidateFragments(const std::string& defrag_file,
		const std::vector<Fragment>& fragments, int64_t fragment_size,
		const FragmentSizeMap& sizes, int64_t total_size);

} // End of namespace Seastitch
#endif
