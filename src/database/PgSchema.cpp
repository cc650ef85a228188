// =============================================================================
// PgSchema.cpp: CREATE TABLE IF NOT EXISTS for everything the aggregator owns
// =============================================================================
// Table names come from the config and are interpolated into the DDL. They
// are safe to interpolate only because ConfigLoader::validate() restricts them
// to [a-z_][a-z0-9_]{0,62}.
// =============================================================================

#include "PgSchema.hpp"
#include "PgErrors.hpp"

#include <iostream>
#include <pqxx/pqxx>

namespace ExecAggregator
{

    void PgSchema::init(const DatabaseConfig &config)
    {
        try
        {
            pqxx::connection C(config.url);
            pqxx::work W(C);

            // One row per (partition, timestamp, side). The primary key is what
            // turns a replayed batch into a unique_violation instead of a
            // silent duplicate.
            W.exec(R"(
                CREATE TABLE IF NOT EXISTS )" +
                   config.aggregate_table + R"( (
                    exchange       TEXT             NOT NULL,
                    instrument     TEXT             NOT NULL,
                    traded_at      BIGINT           NOT NULL,
                    side           CHAR(1)          NOT NULL CHECK (side IN ('B','S','N')),
                    volume_sum     DOUBLE PRECISION NOT NULL,
                    trade_count    BIGINT           NOT NULL CHECK (trade_count > 0),
                    price_open     DOUBLE PRECISION NOT NULL,
                    price_close    DOUBLE PRECISION NOT NULL,
                    price_high     DOUBLE PRECISION NOT NULL,
                    price_low      DOUBLE PRECISION NOT NULL,
                    first_sequence BIGINT           NOT NULL,
                    last_sequence  BIGINT           NOT NULL,
                    PRIMARY KEY (exchange, instrument, traded_at, side)
                )
            )");

            // last_sequence: exclusive lower bound of the next batch.
            // intent_*: set only while a split-store commit is in progress.
            W.exec(R"(
                CREATE TABLE IF NOT EXISTS )" +
                   config.watermark_table + R"( (
                    exchange      TEXT        NOT NULL,
                    instrument    TEXT        NOT NULL,
                    last_sequence BIGINT      NOT NULL DEFAULT 0 CHECK (last_sequence >= 0),
                    intent_first  BIGINT,
                    intent_last   BIGINT,
                    intent_rows   BIGINT,
                    intent_digest BIGINT,
                    updated_at    TIMESTAMPTZ NOT NULL DEFAULT now(),
                    PRIMARY KEY (exchange, instrument)
                )
            )");

            W.exec(R"(
                CREATE TABLE IF NOT EXISTS )" +
                   config.lease_table + R"( (
                    exchange   TEXT        NOT NULL,
                    instrument TEXT        NOT NULL,
                    owner      TEXT        NOT NULL,
                    expires_at TIMESTAMPTZ NOT NULL,
                    PRIMARY KEY (exchange, instrument)
                )
            )");

            W.commit();
            std::cout << "[DB] Schema initialized (tables: " << config.aggregate_table << ", "
                      << config.watermark_table << ", " << config.lease_table << ").\n";
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "init schema");
        }
    }

    void PgSchema::init_raw_table(const DatabaseConfig &config)
    {
        try
        {
            pqxx::connection C(config.url);
            pqxx::work W(C);

            // The primary key doubles as the index every fetch walks:
            // WHERE exchange = $1 AND instrument = $2 AND sequence > $3 ORDER BY sequence.
            W.exec(R"(
                CREATE TABLE IF NOT EXISTS )" +
                   config.raw_table + R"( (
                    exchange   TEXT             NOT NULL,
                    instrument TEXT             NOT NULL,
                    sequence   BIGINT           NOT NULL CHECK (sequence > 0),
                    traded_at  BIGINT           NOT NULL,
                    price      DOUBLE PRECISION,
                    volume     DOUBLE PRECISION,
                    side       CHAR(1),
                    PRIMARY KEY (exchange, instrument, sequence)
                )
            )");

            W.commit();
            std::cout << "[DB] Raw table " << config.raw_table << " ready.\n";
        }
        catch (const std::exception &e)
        {
            throw to_pipeline_error(e, "init raw table");
        }
    }

} // namespace ExecAggregator
