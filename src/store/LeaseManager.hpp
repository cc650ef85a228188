#pragma once

#include <chrono>
#include <string>
#include "../model/Execution.hpp"

namespace ExecAggregator
{

    /**
     * @brief Cross-process claim on a partition.
     *
     * The scheduler already keeps one cycle per partition inside a process;
     * leases extend that to several aggregator processes sharing a database.
     * A lease expires on its own, so a crashed owner never blocks a partition
     * for longer than the TTL.
     */
    class LeaseManager
    {
    public:
        virtual ~LeaseManager() = default;

        // Claims or renews. False when another live owner holds the partition.
        virtual bool try_acquire(const PartitionKey &partition, const std::string &owner, std::chrono::milliseconds ttl) = 0;

        virtual void release(const PartitionKey &partition, const std::string &owner) = 0;
    };

} // namespace ExecAggregator
