#include "AggregationEngine.hpp"
#include "../errors/PipelineError.hpp"
#include "../validator/ExecutionValidator.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace ExecAggregator
{

    // =========================================================================
    // reduce()
    // =========================================================================
    // ONE PASS, SEQUENCE ORDER:
    //
    //   seq=1 ts=100 B p=10 v=2  ─┐
    //   seq=2 ts=100 B p=12 v=3  ─┴─> (100,B) open=10 close=12 high=12 low=10 vol=5 n=2
    //   seq=3 ts=105 S p=9  v=1  ───> (105,S) open=9  close=9  high=9  low=9  vol=1 n=1
    //
    // open  = price of the first row that touches the group
    // close = price of the last row that touches the group (last update wins)
    // Rows sharing (timestamp, side) are ordered by sequence, so the smaller
    // sequence is always "earlier". That is the only tie-break rule.
    //
    // WHY std::map AND NOT unordered_map?
    // Output order must not depend on hashing or insertion history. Iterating
    // a map keyed by (timestamp, side) emits rows already sorted, so the
    // encoded payload is byte-identical on every retry.
    // =========================================================================
    std::vector<AggregatedRow> AggregationEngine::reduce(const Batch &batch) const
    {
        std::vector<AggregatedRow> out;
        if (batch.empty())
            return out;

        const PartitionKey &partition = batch.front().partition;
        const SequenceRange range{batch.front().sequence - 1, batch.back().sequence};

        std::map<std::pair<std::int64_t, char>, AggregatedRow> groups;

        const RawExecution *previous = nullptr;
        for (const auto &row : batch)
        {
            auto check = ExecutionValidator::validate(row);
            if (check.valid && previous != nullptr)
                check = ExecutionValidator::validate_order(*previous, row);
            if (!check.valid)
                throw PipelineError(ErrorKind::Encoding, partition, range, check.reason);
            previous = &row;

            const double price = *row.price;
            const double volume = *row.volume;

            auto [it, inserted] = groups.try_emplace({row.timestamp, to_char(row.side)});
            AggregatedRow &acc = it->second;

            if (inserted)
            {
                acc.partition = row.partition;
                acc.timestamp = row.timestamp;
                acc.side = row.side;
                acc.price_open = price;
                acc.price_high = price;
                acc.price_low = price;
                acc.first_sequence = row.sequence;
            }

            acc.volume_sum += volume;
            acc.trade_count += 1;
            acc.price_close = price;
            acc.price_high = std::max(acc.price_high, price);
            acc.price_low = std::min(acc.price_low, price);
            acc.last_sequence = row.sequence;
        }

        out.reserve(groups.size());
        for (auto &[key, row] : groups)
            out.push_back(std::move(row));

        return out;
    }

} // namespace ExecAggregator
