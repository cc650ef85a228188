#include "PgAggregateStore.hpp"
#include "PgErrors.hpp"
#include "../encoding/BulkEncoder.hpp"

#include <iostream>
#include <string_view>

namespace ExecAggregator
{

    namespace
    {
        // Each scope has its own connection, so one fixed name never collides.
        constexpr const char *kStagingTable = "exec_aggregator_staging";

        std::string column_list()
        {
            std::string columns;
            for (const char *name : BulkEncoder::kColumns)
            {
                if (!columns.empty())
                    columns += ", ";
                columns += name;
            }
            return columns;
        }

        std::string timeout_statement(std::chrono::milliseconds timeout)
        {
            return "SET LOCAL statement_timeout = " + std::to_string(timeout.count());
        }
    }

    // =========================================================================
    // PgCommitScope
    // =========================================================================
    PgCommitScope::PgCommitScope(const std::string &conn_str,
                                 std::string aggregate_table,
                                 std::chrono::milliseconds timeout)
        : connection_(conn_str),
          work_(connection_),
          table_(std::move(aggregate_table))
    {
        work_.exec(timeout_statement(timeout));
    }

    // =========================================================================
    // bulk_load()
    // =========================================================================
    // WHY STAGE INSTEAD OF COPYING STRAIGHT INTO THE DESTINATION?
    // COPY into a table with a primary key aborts on the first duplicate with
    // a bare unique_violation; staging first lets the INSERT ... SELECT report
    // exactly how many rows landed, which is checked against the payload.
    // The staging table is dropped by PostgreSQL at COMMIT/ROLLBACK.
    // =========================================================================
    void PgCommitScope::bulk_load(const BulkPayload &payload)
    {
        const std::string columns = column_list();

        try
        {
            work_.exec(std::string("CREATE TEMP TABLE ") + kStagingTable +
                       " (LIKE " + table_ + " INCLUDING DEFAULTS) ON COMMIT DROP");

            // The payload is already COPY TEXT; stream it line by line without
            // re-parsing. write_raw_line() adds the terminating newline itself.
            auto stream = pqxx::stream_to::raw_table(work_, kStagingTable, columns);
            std::string_view text = payload.text;
            while (!text.empty())
            {
                const auto eol = text.find('\n');
                const auto line = text.substr(0, eol);
                stream.write_raw_line(line);
                text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);
            }
            stream.complete();

            pqxx::result r = work_.exec("INSERT INTO " + table_ + " (" + columns + ") SELECT " + columns +
                                        " FROM " + kStagingTable);

            if (static_cast<std::size_t>(r.affected_rows()) != payload.row_count)
            {
                throw PipelineError(ErrorKind::Consistency,
                                    "bulk load inserted " + std::to_string(r.affected_rows()) +
                                        " rows, payload has " + std::to_string(payload.row_count));
            }
        }
        catch (const PipelineError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "bulk load");
        }
    }

    void PgCommitScope::commit()
    {
        try
        {
            work_.commit();
        }
        catch (const std::exception &e)
        {
            // A connection lost during COMMIT surfaces as in_doubt_error -> UnknownOutcome.
            throw to_pipeline_error(e, "commit");
        }
    }

    // =========================================================================
    // PgAggregateStore
    // =========================================================================
    PgAggregateStore::PgAggregateStore(const DatabaseConfig &config,
                                       std::chrono::milliseconds commit_timeout,
                                       std::chrono::milliseconds read_timeout)
        : conn_str_(config.url),
          aggregate_table_(config.aggregate_table),
          watermark_table_(config.watermark_table),
          lease_table_(config.lease_table),
          commit_timeout_(commit_timeout),
          read_timeout_(read_timeout)
    {
    }

    std::unique_ptr<CommitScope> PgAggregateStore::begin()
    {
        try
        {
            return std::make_unique<PgCommitScope>(conn_str_, aggregate_table_, commit_timeout_);
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "begin commit scope");
        }
    }

    PgCommitScope &PgAggregateStore::pg_scope(CommitScope &scope)
    {
        auto *pg = dynamic_cast<PgCommitScope *>(&scope);
        if (pg == nullptr)
            throw PipelineError(ErrorKind::Fatal, "watermark write through a scope of another destination");
        return *pg;
    }

    Sequence PgAggregateStore::get(const PartitionKey &partition)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::read_transaction T(C);
            T.exec(timeout_statement(read_timeout_));

            pqxx::result r = T.exec("SELECT last_sequence FROM " + watermark_table_ +
                                        " WHERE exchange = $1 AND instrument = $2",
                                    pqxx::params{partition.exchange, partition.instrument});

            return r.empty() ? kBeginning : r[0][0].as<Sequence>();
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "read watermark " + partition.to_string());
        }
    }

    // =========================================================================
    // advance(): compare-and-set on the watermark row
    // =========================================================================
    // Under READ COMMITTED a concurrent advance of the same row blocks on the
    // row lock, then re-evaluates "last_sequence = from" against the committed
    // value and matches nothing. Zero affected rows = someone else moved the
    // watermark = Conflict (resolved by the CommitCoordinator).
    // =========================================================================
    void PgAggregateStore::advance(const PartitionKey &partition, Sequence from, Sequence to, CommitScope &scope)
    {
        if (to <= from)
        {
            throw PipelineError(ErrorKind::Consistency, partition, SequenceRange{from, to},
                                "watermark may only move forward");
        }

        auto &W = pg_scope(scope).work();
        try
        {
            pqxx::result r;
            if (from == kBeginning)
            {
                // First batch of the partition: the row may not exist yet, or
                // exist at 0 with an intent recorded.
                r = W.exec("INSERT INTO " + watermark_table_ +
                               " AS w (exchange, instrument, last_sequence, updated_at)"
                               " VALUES ($1, $2, $3, now())"
                               " ON CONFLICT (exchange, instrument) DO UPDATE"
                               " SET last_sequence = EXCLUDED.last_sequence,"
                               " intent_first = NULL, intent_last = NULL, intent_rows = NULL, intent_digest = NULL,"
                               " updated_at = now()"
                               " WHERE w.last_sequence = 0",
                           pqxx::params{partition.exchange, partition.instrument, to});
            }
            else
            {
                r = W.exec("UPDATE " + watermark_table_ +
                               " SET last_sequence = $3,"
                               " intent_first = NULL, intent_last = NULL, intent_rows = NULL, intent_digest = NULL,"
                               " updated_at = now()"
                               " WHERE exchange = $1 AND instrument = $2 AND last_sequence = $4",
                           pqxx::params{partition.exchange, partition.instrument, to, from});
            }

            if (r.affected_rows() != 1)
            {
                throw PipelineError(ErrorKind::Conflict, partition, SequenceRange{from, to},
                                    "watermark is no longer " + std::to_string(from));
            }
        }
        catch (const PipelineError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "advance watermark").with_context(partition, SequenceRange{from, to});
        }
    }

    std::optional<CommitIntent> PgAggregateStore::pending_intent(const PartitionKey &partition)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::read_transaction T(C);
            T.exec(timeout_statement(read_timeout_));

            pqxx::result r = T.exec("SELECT intent_first, intent_last, intent_rows, intent_digest FROM " +
                                        watermark_table_ +
                                        " WHERE exchange = $1 AND instrument = $2 AND intent_first IS NOT NULL",
                                    pqxx::params{partition.exchange, partition.instrument});
            if (r.empty())
                return std::nullopt;

            CommitIntent intent;
            intent.partition = partition;
            intent.first_sequence = r[0][0].as<Sequence>();
            intent.last_sequence = r[0][1].as<Sequence>();
            intent.row_count = static_cast<std::size_t>(r[0][2].as<std::int64_t>());
            // BIGINT holds the 64-bit digest bit-for-bit.
            intent.digest = static_cast<std::uint64_t>(r[0][3].as<std::int64_t>());
            return intent;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "read intent " + partition.to_string());
        }
    }

    void PgAggregateStore::record_intent(const CommitIntent &intent, CommitScope &scope)
    {
        auto &W = pg_scope(scope).work();
        try
        {
            W.exec("INSERT INTO " + watermark_table_ +
                       " (exchange, instrument, last_sequence, intent_first, intent_last, intent_rows, intent_digest)"
                       " VALUES ($1, $2, 0, $3, $4, $5, $6)"
                       " ON CONFLICT (exchange, instrument) DO UPDATE"
                       " SET intent_first = EXCLUDED.intent_first, intent_last = EXCLUDED.intent_last,"
                       " intent_rows = EXCLUDED.intent_rows, intent_digest = EXCLUDED.intent_digest,"
                       " updated_at = now()",
                   pqxx::params{intent.partition.exchange, intent.partition.instrument,
                                intent.first_sequence, intent.last_sequence,
                                static_cast<std::int64_t>(intent.row_count),
                                static_cast<std::int64_t>(intent.digest)});
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "record intent").with_context(
                intent.partition, SequenceRange{intent.first_sequence - 1, intent.last_sequence});
        }
    }

    // =========================================================================
    // Leases
    // =========================================================================
    // One upsert claims a free row, renews our own row, or steals an expired
    // one. A live lease of another owner fails the WHERE and changes nothing.
    // =========================================================================
    bool PgAggregateStore::try_acquire(const PartitionKey &partition,
                                       const std::string &owner,
                                       std::chrono::milliseconds ttl)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);
            W.exec(timeout_statement(read_timeout_));

            pqxx::result r = W.exec("INSERT INTO " + lease_table_ +
                                        " AS l (exchange, instrument, owner, expires_at)"
                                        " VALUES ($1, $2, $3, now() + make_interval(secs => $4::double precision / 1000))"
                                        " ON CONFLICT (exchange, instrument) DO UPDATE"
                                        " SET owner = EXCLUDED.owner, expires_at = EXCLUDED.expires_at"
                                        " WHERE l.owner = EXCLUDED.owner OR l.expires_at < now()",
                                    pqxx::params{partition.exchange, partition.instrument, owner,
                                                 static_cast<std::int64_t>(ttl.count())});
            W.commit();
            return r.affected_rows() == 1;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "acquire lease " + partition.to_string());
        }
    }

    void PgAggregateStore::release(const PartitionKey &partition, const std::string &owner)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);
            W.exec("DELETE FROM " + lease_table_ + " WHERE exchange = $1 AND instrument = $2 AND owner = $3",
                   pqxx::params{partition.exchange, partition.instrument, owner});
            W.commit();
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "release lease " + partition.to_string());
        }
    }

} // namespace ExecAggregator
