#include "PipelineError.hpp"

namespace ExecAggregator
{

    std::string_view to_string(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::TransientIo:
            return "transient-io";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Encoding:
            return "encoding";
        case ErrorKind::Conflict:
            return "conflict";
        case ErrorKind::Consistency:
            return "consistency";
        case ErrorKind::UnknownOutcome:
            return "unknown-outcome";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Fatal:
            return "fatal";
        }
        return "unknown";
    }

    bool halts_scheduler(ErrorKind kind)
    {
        return kind == ErrorKind::Configuration || kind == ErrorKind::Fatal;
    }

    PipelineError::PipelineError(ErrorKind kind, std::string message)
        : std::runtime_error(render(kind, std::nullopt, std::nullopt, message)),
          kind_(kind),
          detail_(std::move(message))
    {
    }

    PipelineError::PipelineError(ErrorKind kind,
                                 PartitionKey partition,
                                 SequenceRange range,
                                 std::string message)
        : std::runtime_error(render(kind, partition, range, message)),
          kind_(kind),
          partition_(std::move(partition)),
          range_(range),
          detail_(std::move(message))
    {
    }

    PipelineError PipelineError::with_context(const PartitionKey &partition, SequenceRange range) const
    {
        if (partition_)
            return *this;
        return PipelineError(kind_, partition, range, detail_);
    }

    // Example: "[encoding] bitflyer/BTC_JPY seq (100, 250]: missing price at sequence 117"
    std::string PipelineError::render(ErrorKind kind,
                                      const std::optional<PartitionKey> &partition,
                                      const std::optional<SequenceRange> &range,
                                      const std::string &message)
    {
        std::string out = "[";
        out += to_string(kind);
        out += "] ";
        if (partition)
            out += partition->to_string();
        if (range)
        {
            if (partition)
                out += ' ';
            out += "seq (" + std::to_string(range->after) + ", " + std::to_string(range->last) + "]";
        }
        if (partition || range)
            out += ": ";
        out += message;
        return out;
    }

} // namespace ExecAggregator
