#pragma once

#include <optional>
#include <string>

#include "absl/status/statusor.h"

#include "common/cancellation.h"
#include "common/workflow_types.h"

namespace Reqflow {

/**
 * What a handler concluded about one work unit.
 */
struct HandlerResult {
    Verdict verdict = Verdict::Pass;
    std::optional<double> score;
    std::string detail;
    PhaseArtifact artifact;
};

/**
 * Per-phase unit of work run by a Delegator's worker pool.
 *
 * Handle() is called concurrently for different units and must observe
 * `token`: once it is cancelled or expired the call should return promptly,
 * usually with token.status(). Failures are classified through the status
 * code (see call_status.h).
 */
class PhaseHandler {
public:
    virtual ~PhaseHandler() = default;

    virtual Phase phase() const = 0;

    // For Mining the unit carries a source document in id/text/source_ref.
    virtual absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
                                                 const CancellationToken& token) = 0;
};

} // namespace Reqflow
