#pragma once

// ============================================================================
// PipelineError: the single exception type that crosses module boundaries
// ============================================================================
//
// Every failure the scheduler has to react to is one of a handful of KINDS.
// The kind decides the reaction, not the message:
//
//   TransientIo     source/destination unreachable      -> backoff + retry
//   Timeout         fetch or commit statement too slow  -> backoff + retry
//   Encoding        batch cannot be reduced/encoded     -> backoff, operator
//   Conflict        duplicate key / watermark CAS miss  -> benign-conflict check
//   Consistency     stores disagree about what landed   -> manual reconciliation
//   UnknownOutcome  connection died during COMMIT       -> re-check watermark
//   Configuration   bad config file / bad identifiers   -> halt everything
//   Fatal           schema missing, no privileges       -> halt everything
//
// Each error carries the partition and the sequence range that was being
// attempted, so the log line alone is enough to decide between retry and
// manual repair.
// ============================================================================

#include <stdexcept>
#include <string>
#include <string_view>
#include <optional>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    enum class ErrorKind
    {
        TransientIo,
        Timeout,
        Encoding,
        Conflict,
        Consistency,
        UnknownOutcome,
        Configuration,
        Fatal
    };

    std::string_view to_string(ErrorKind kind);

    // Kinds that must stop the dispatch of new cycles for every partition.
    bool halts_scheduler(ErrorKind kind);

    class PipelineError : public std::runtime_error
    {
    public:
        PipelineError(ErrorKind kind, std::string message);

        PipelineError(ErrorKind kind,
                      PartitionKey partition,
                      SequenceRange range,
                      std::string message);

        ErrorKind kind() const noexcept { return kind_; }
        const std::optional<PartitionKey> &partition() const noexcept { return partition_; }
        const std::optional<SequenceRange> &range() const noexcept { return range_; }
        const std::string &detail() const noexcept { return detail_; }

        // Same error, stamped with the partition/range the caller was working on.
        // Used where a low layer (e.g. pqxx translation) did not know them.
        PipelineError with_context(const PartitionKey &partition, SequenceRange range) const;

    private:
        static std::string render(ErrorKind kind,
                                  const std::optional<PartitionKey> &partition,
                                  const std::optional<SequenceRange> &range,
                                  const std::string &message);

        ErrorKind kind_;
        std::optional<PartitionKey> partition_;
        std::optional<SequenceRange> range_;
        std::string detail_;
    };

} // namespace ExecAggregator
