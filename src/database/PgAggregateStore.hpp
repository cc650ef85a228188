#pragma once

// ============================================================================
// PgAggregateStore: destination table, watermarks and leases in ONE database
// ============================================================================
// Because all three tables live in the same PostgreSQL database, one
// PgCommitScope (one pqxx::work) covers both the bulk load and the watermark
// advance:
//
//   BEGIN
//     SET LOCAL statement_timeout = <commit_timeout>
//     CREATE TEMP TABLE staging (LIKE destination) ON COMMIT DROP
//     COPY staging FROM STDIN          <- payload lines, streamed
//     INSERT INTO destination SELECT * FROM staging
//     UPDATE watermarks SET last_sequence = to WHERE last_sequence = from
//   COMMIT
//
// so transactional_with_watermarks() is true and no intent is ever needed.
// ============================================================================

#include <chrono>
#include <memory>
#include <string>
#include <pqxx/pqxx>
#include "../config/PipelineConfig.hpp"
#include "../store/CommitStores.hpp"
#include "../store/LeaseManager.hpp"

namespace ExecAggregator
{

    /**
     * @brief One transaction on its own connection. Destroying it without
     * commit() aborts the transaction (pqxx::work does that in its destructor).
     */
    class PgCommitScope : public CommitScope
    {
    public:
        PgCommitScope(const std::string &conn_str, std::string aggregate_table, std::chrono::milliseconds timeout);

        void bulk_load(const BulkPayload &payload) override;
        void commit() override;

        pqxx::work &work() { return work_; }

    private:
        pqxx::connection connection_;
        pqxx::work work_; // must be declared after connection_
        std::string table_;
    };

    class PgAggregateStore : public Destination, public WatermarkStore, public LeaseManager
    {
    public:
        PgAggregateStore(const DatabaseConfig &config,
                         std::chrono::milliseconds commit_timeout,
                         std::chrono::milliseconds read_timeout);

        // ── Destination ───────────────────────────────────────────────────
        std::unique_ptr<CommitScope> begin() override;
        bool transactional_with_watermarks() const override { return true; }

        // ── WatermarkStore ────────────────────────────────────────────────
        Sequence get(const PartitionKey &partition) override;
        void advance(const PartitionKey &partition, Sequence from, Sequence to, CommitScope &scope) override;
        std::optional<CommitIntent> pending_intent(const PartitionKey &partition) override;
        void record_intent(const CommitIntent &intent, CommitScope &scope) override;

        // ── LeaseManager ──────────────────────────────────────────────────
        bool try_acquire(const PartitionKey &partition, const std::string &owner, std::chrono::milliseconds ttl) override;
        void release(const PartitionKey &partition, const std::string &owner) override;

    private:
        static PgCommitScope &pg_scope(CommitScope &scope);

        std::string conn_str_;
        std::string aggregate_table_;
        std::string watermark_table_;
        std::string lease_table_;
        std::chrono::milliseconds commit_timeout_;
        std::chrono::milliseconds read_timeout_;
    };

} // namespace ExecAggregator
