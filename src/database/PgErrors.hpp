#pragma once

// ============================================================================
// libpqxx exception -> ErrorKind
// ============================================================================
// libpqxx throws a rich hierarchy (broken_connection, sql_error and its
// SQLSTATE-specific subclasses, in_doubt_error...). Nothing above
// src/database/ should know about pqxx, so every Pg* method catches at its
// boundary and rethrows a PipelineError of the matching kind.
// ============================================================================

#include <exception>
#include <string_view>
#include "../errors/PipelineError.hpp"

namespace ExecAggregator
{

    //   broken_connection          -> TransientIo
    //   in_doubt_error             -> UnknownOutcome
    //   query_cancelled            -> Timeout  (statement_timeout fired)
    //   unique_violation           -> Conflict
    //   transaction_rollback       -> TransientIo (serialization failure, deadlock)
    //   undefined_table/column,
    //   insufficient_privilege,
    //   syntax_error, usage_error  -> Fatal
    //   conversion_error           -> Encoding (a raw value pqxx cannot parse)
    //   any other sql_error        -> TransientIo
    ErrorKind classify_pg_error(const std::exception &e);

    // Logs "[DB ERROR] <operation> failed: ..." and returns the translated error.
    PipelineError to_pipeline_error(const std::exception &e, std::string_view operation);

} // namespace ExecAggregator
