#pragma once

// ============================================================================
// ExecutionValidator: can this raw row be folded into an aggregate?
// ============================================================================
// This is NOT trade-semantics validation. A price of 0.0001 or 10'000'000 is
// the downloader's business. What we check here is only what reduction needs:
//
//   - price and volume are present (the raw columns are nullable)
//   - price and volume are finite (NaN would poison sum/high/low forever)
//   - sequence is strictly increasing inside the batch
//   - timestamp is non-decreasing inside the batch (the no-split guarantee
//     depends on timestamp groups being contiguous in sequence order)
//   - every row belongs to the same partition
//
// A failing row is never skipped. Skipping would let the watermark move past
// it and drop it permanently.
// ============================================================================

#include <cmath>
#include <string>
#include <optional>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    struct ValidationResult
    {
        bool valid;
        std::string reason;

        static ValidationResult ok()
        {
            return {true, ""};
        }

        static ValidationResult fail(std::string reason)
        {
            return {false, std::move(reason)};
        }
    };

    class ExecutionValidator
    {
    public:
        // Checks one row in isolation.
        [[nodiscard]]
        static ValidationResult validate(const RawExecution &row)
        {
            if (!row.price)
                return ValidationResult::fail("missing price at sequence " + std::to_string(row.sequence));

            if (!std::isfinite(*row.price))
                return ValidationResult::fail("non-finite price at sequence " + std::to_string(row.sequence));

            if (!row.volume)
                return ValidationResult::fail("missing volume at sequence " + std::to_string(row.sequence));

            if (!std::isfinite(*row.volume))
                return ValidationResult::fail("non-finite volume at sequence " + std::to_string(row.sequence));

            if (row.sequence <= kBeginning)
                return ValidationResult::fail("non-positive sequence " + std::to_string(row.sequence));

            return ValidationResult::ok();
        }

        // Checks a row against its predecessor in the batch.
        [[nodiscard]]
        static ValidationResult validate_order(const RawExecution &previous, const RawExecution &row)
        {
            if (row.partition != previous.partition)
            {
                return ValidationResult::fail(
                    "batch mixes partitions " + previous.partition.to_string() +
                    " and " + row.partition.to_string());
            }

            if (row.sequence <= previous.sequence)
            {
                return ValidationResult::fail(
                    "sequence " + std::to_string(row.sequence) +
                    " does not increase after " + std::to_string(previous.sequence));
            }

            if (row.timestamp < previous.timestamp)
            {
                return ValidationResult::fail(
                    "timestamp goes backwards at sequence " + std::to_string(row.sequence) +
                    " (" + std::to_string(row.timestamp) + " < " + std::to_string(previous.timestamp) + ")");
            }

            return ValidationResult::ok();
        }
    };

} // namespace ExecAggregator
