#include "BatchBoundary.hpp"

namespace ExecAggregator
{

    // Index of the first row of the trailing timestamp group.
    // Timestamps are non-decreasing, so the group is a contiguous suffix.
    static std::size_t trailing_group_start(const Batch &rows)
    {
        std::size_t cut = rows.size();
        const std::int64_t ts = rows.back().timestamp;
        while (cut > 0 && rows[cut - 1].timestamp == ts)
            --cut;
        return cut;
    }

    SealedBatch BatchBoundary::seal(Batch fetched, std::size_t max_rows)
    {
        SealedBatch sealed;

        if (fetched.size() <= max_rows)
        {
            sealed.rows = std::move(fetched);
            sealed.source_exhausted = true;
            return sealed;
        }

        fetched.resize(max_rows + 1);
        RawExecution lookahead = std::move(fetched.back());
        fetched.pop_back();

        if (lookahead.timestamp != fetched.back().timestamp)
        {
            sealed.rows = std::move(fetched);
            return sealed;
        }

        std::size_t cut = trailing_group_start(fetched);
        if (cut > 0)
        {
            fetched.resize(cut);
            sealed.rows = std::move(fetched);
            return sealed;
        }

        // One group bigger than max_rows: keep the lookahead and ask for the rest.
        sealed.extend_timestamp = lookahead.timestamp;
        fetched.push_back(std::move(lookahead));
        sealed.rows = std::move(fetched);
        return sealed;
    }

    std::size_t BatchBoundary::hold_back_recent_tail(Batch &rows, std::int64_t cutoff_timestamp)
    {
        if (rows.empty() || rows.back().timestamp < cutoff_timestamp)
            return 0;

        std::size_t cut = trailing_group_start(rows);
        std::size_t held = rows.size() - cut;
        rows.resize(cut);
        return held;
    }

} // namespace ExecAggregator
