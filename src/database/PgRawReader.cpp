#include "PgRawReader.hpp"
#include "PgErrors.hpp"

#include <pqxx/pqxx>

namespace ExecAggregator
{

    namespace
    {
        // Column order of select_columns(): sequence, traded_at, price, volume, side
        Batch to_batch(const PartitionKey &partition, const pqxx::result &rows)
        {
            Batch batch;
            batch.reserve(rows.size());

            for (const auto &row : rows)
            {
                RawExecution e;
                e.partition = partition;
                e.sequence = row[0].as<std::int64_t>();
                e.timestamp = row[1].as<std::int64_t>();
                if (!row[2].is_null())
                    e.price = row[2].as<double>();
                if (!row[3].is_null())
                    e.volume = row[3].as<double>();

                e.side = PgRawReader::parse_side(
                    partition, e.sequence,
                    row[4].is_null() ? std::nullopt : std::optional<std::string>(row[4].as<std::string>()));

                batch.push_back(std::move(e));
            }
            return batch;
        }

        // Per-transaction limit; RESET is implicit at the end of the transaction.
        void set_statement_timeout(pqxx::transaction_base &tx, std::chrono::milliseconds timeout)
        {
            tx.exec("SET LOCAL statement_timeout = " + std::to_string(timeout.count()));
        }
    }

    Side PgRawReader::parse_side(const PartitionKey &partition, Sequence sequence, const std::optional<std::string> &side)
    {
        // A side-less source selects 'N', so NULL here is a row the downloader
        // wrote without a side on a side-aware table.
        std::optional<Side> parsed;
        if (side && side->size() == 1)
            parsed = side_from_char(side->front());

        if (!parsed)
        {
            throw PipelineError(ErrorKind::Encoding, partition, SequenceRange{sequence - 1, sequence},
                                side ? "unknown side '" + *side + "' at sequence " + std::to_string(sequence)
                                     : "missing side at sequence " + std::to_string(sequence));
        }
        return *parsed;
    }

    PgRawReader::PgRawReader(const DatabaseConfig &config, std::chrono::milliseconds fetch_timeout)
        : conn_str_(config.url),
          table_(config.raw_table),
          has_side_(config.source_has_side),
          timeout_(fetch_timeout)
    {
    }

    std::string PgRawReader::select_columns() const
    {
        // Without a side column every row is 'N' and the side never splits a group.
        return has_side_ ? "sequence, traded_at, price, volume, side"
                         : "sequence, traded_at, price, volume, 'N'::char(1) AS side";
    }

    Batch PgRawReader::fetch(const PartitionKey &partition, Sequence after_sequence, std::size_t max_rows)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::read_transaction T(C);
            set_statement_timeout(T, timeout_);

            pqxx::result r = T.exec(
                "SELECT " + select_columns() + " FROM " + table_ +
                    " WHERE exchange = $1 AND instrument = $2 AND sequence > $3"
                    " ORDER BY sequence LIMIT $4",
                pqxx::params{partition.exchange, partition.instrument, after_sequence,
                             static_cast<std::int64_t>(max_rows)});

            return to_batch(partition, r);
        }
        catch (const PipelineError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "fetch " + partition.to_string()).with_context(
                partition, SequenceRange{after_sequence, after_sequence});
        }
    }

    Batch PgRawReader::fetch_group(const PartitionKey &partition, Sequence after_sequence, std::int64_t timestamp)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::read_transaction T(C);
            set_statement_timeout(T, timeout_);

            pqxx::result r = T.exec(
                "SELECT " + select_columns() + " FROM " + table_ +
                    " WHERE exchange = $1 AND instrument = $2 AND sequence > $3 AND traded_at = $4"
                    " ORDER BY sequence",
                pqxx::params{partition.exchange, partition.instrument, after_sequence, timestamp});

            return to_batch(partition, r);
        }
        catch (const PipelineError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "fetch group " + partition.to_string()).with_context(
                partition, SequenceRange{after_sequence, after_sequence});
        }
    }

    Batch PgRawReader::fetch_through(const PartitionKey &partition, Sequence after_sequence, Sequence last_sequence)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::read_transaction T(C);
            set_statement_timeout(T, timeout_);

            pqxx::result r = T.exec(
                "SELECT " + select_columns() + " FROM " + table_ +
                    " WHERE exchange = $1 AND instrument = $2 AND sequence > $3 AND sequence <= $4"
                    " ORDER BY sequence",
                pqxx::params{partition.exchange, partition.instrument, after_sequence, last_sequence});

            return to_batch(partition, r);
        }
        catch (const PipelineError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "fetch through " + partition.to_string()).with_context(
                partition, SequenceRange{after_sequence, last_sequence});
        }
    }

    std::vector<PartitionKey> PgRawReader::list_partitions()
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::read_transaction T(C);
            set_statement_timeout(T, timeout_);

            pqxx::result r = T.exec("SELECT DISTINCT exchange, instrument FROM " + table_ + " ORDER BY 1, 2");

            std::vector<PartitionKey> keys;
            keys.reserve(r.size());
            for (const auto &row : r)
                keys.push_back(PartitionKey{row[0].as<std::string>(), row[1].as<std::string>()});
            return keys;
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "list partitions");
        }
    }

} // namespace ExecAggregator
