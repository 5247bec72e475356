#ifndef INCLUDE_FRAGMENT_SELECTOR_H_
#define INCLUDE_FRAGMENT_SELECTOR_H_

#include <vector>

#include "classifier/file_code.h"
#include "reassembly/validation.h"

namespace Seastitch {

/**
 * Collapse interrupted (.PARTIAL.<n>) and final variants of the same fragment
 * slot to a single entry.
 *
 * The input must be sorted with FragmentLess: variants of one slot are
 * adjacent and the final variant follows every partial. Unsorted input is
 * outside the contract and yields duplicates.
 *
 * A partial replaced by a final variant is reported in outcome as a
 * PARTIAL transfer. A partial that is kept because no final exists is
 * reported as a PARTIAL file. Both entries carry a resend hint.
 */
std::vector<FileCode> SelectFragments(const std::vector<FileCode>& sorted,
		ValidationOutcome* outcome);

} // End of namespace Seastitch
#endif
