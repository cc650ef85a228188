#include "PgErrors.hpp"

#include <iostream>
#include <string>
#include <pqxx/pqxx>

namespace ExecAggregator
{

    // Order matters: pqxx subclasses first, their bases after
    // (undefined_table IS-A syntax_error IS-A sql_error IS-A failure).
    ErrorKind classify_pg_error(const std::exception &e)
    {
        if (dynamic_cast<const pqxx::in_doubt_error *>(&e) != nullptr)
            return ErrorKind::UnknownOutcome;
        if (dynamic_cast<const pqxx::statement_completion_unknown *>(&e) != nullptr)
            return ErrorKind::UnknownOutcome;
        if (dynamic_cast<const pqxx::broken_connection *>(&e) != nullptr)
            return ErrorKind::TransientIo;

        if (dynamic_cast<const pqxx::query_cancelled *>(&e) != nullptr)
            return ErrorKind::Timeout;
        if (dynamic_cast<const pqxx::unique_violation *>(&e) != nullptr)
            return ErrorKind::Conflict;
        if (dynamic_cast<const pqxx::transaction_rollback *>(&e) != nullptr)
            return ErrorKind::TransientIo;

        if (dynamic_cast<const pqxx::undefined_table *>(&e) != nullptr ||
            dynamic_cast<const pqxx::undefined_column *>(&e) != nullptr ||
            dynamic_cast<const pqxx::insufficient_privilege *>(&e) != nullptr ||
            dynamic_cast<const pqxx::syntax_error *>(&e) != nullptr)
            return ErrorKind::Fatal;

        if (dynamic_cast<const pqxx::sql_error *>(&e) != nullptr)
            return ErrorKind::TransientIo;

        if (dynamic_cast<const pqxx::conversion_error *>(&e) != nullptr)
            return ErrorKind::Encoding;
        if (dynamic_cast<const pqxx::usage_error *>(&e) != nullptr)
            return ErrorKind::Fatal;

        // pqxx::failure and anything else coming out of the socket layer.
        return ErrorKind::TransientIo;
    }

    PipelineError to_pipeline_error(const std::exception &e, std::string_view operation)
    {
        const ErrorKind kind = classify_pg_error(e);
        std::cerr << "[DB ERROR] " << operation << " failed (" << to_string(kind) << "): " << e.what() << "\n";
        return PipelineError(kind, std::string(operation) + ": " + e.what());
    }

} // namespace ExecAggregator
