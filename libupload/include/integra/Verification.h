#ifndef INTEGRA_LIBUPLOAD_INTEGRA_VERIFICATION_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_VERIFICATION_H_

#include <vector>

#include "integra/Cancellation.h"
#include "integra/ObjectStore.h"
#include "integra/Partitioner.h"
#include "integra/Reporter.h"
#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

/// VerifyUploadedParts lists the parts the store has on record for upload
/// and checks them against the parts that were uploaded: the same count, the
/// same part numbers and sizes, and for each part a server checksum equal to
/// the checksum recomputed from the part's bytes.
///
/// Any discrepancy is a VerificationError. On success, returns the listed
/// parts.
INTEGRA_EXPORT Result<std::vector<ListedPart>> VerifyUploadedParts(
    ObjectStore& store, const UploadRef& upload,
    const std::vector<Part>& uploaded, const CancellationToken* token,
    Reporter* reporter);

}  // namespace integra

#endif
