#include <gtest/gtest.h>

#include <stdexcept>
#include <pqxx/pqxx>
#include "../src/database/PgErrors.hpp"

using namespace ExecAggregator;

TEST(PgErrors, ConnectionLossIsTransient)
{
    EXPECT_EQ(classify_pg_error(pqxx::broken_connection{"server closed the connection"}), ErrorKind::TransientIo);
}

TEST(PgErrors, LostCommitAcknowledgementIsUnknownOutcome)
{
    EXPECT_EQ(classify_pg_error(pqxx::in_doubt_error{"commit status unknown"}), ErrorKind::UnknownOutcome);
}

TEST(PgErrors, StatementTimeoutIsTimeout)
{
    EXPECT_EQ(classify_pg_error(pqxx::query_cancelled{"canceling statement due to statement timeout"}),
              ErrorKind::Timeout);
}

TEST(PgErrors, DuplicateKeyIsConflict)
{
    EXPECT_EQ(classify_pg_error(pqxx::unique_violation{"duplicate key value violates unique constraint"}),
              ErrorKind::Conflict);
}

TEST(PgErrors, SchemaAndPermissionProblemsAreFatal)
{
    EXPECT_EQ(classify_pg_error(pqxx::undefined_table{"relation does not exist"}), ErrorKind::Fatal);
    EXPECT_EQ(classify_pg_error(pqxx::undefined_column{"column does not exist"}), ErrorKind::Fatal);
    EXPECT_EQ(classify_pg_error(pqxx::insufficient_privilege{"permission denied"}), ErrorKind::Fatal);
    EXPECT_EQ(classify_pg_error(pqxx::usage_error{"misuse"}), ErrorKind::Fatal);
}

TEST(PgErrors, SerializationFailureIsRetried)
{
    EXPECT_EQ(classify_pg_error(pqxx::serialization_failure{"could not serialize access"}), ErrorKind::TransientIo);
    EXPECT_EQ(classify_pg_error(pqxx::deadlock_detected{"deadlock detected"}), ErrorKind::TransientIo);
}

TEST(PgErrors, UnparsableValueIsEncoding)
{
    EXPECT_EQ(classify_pg_error(pqxx::conversion_error{"could not convert"}), ErrorKind::Encoding);
}

TEST(PgErrors, UnknownExceptionsAreTransient)
{
    EXPECT_EQ(classify_pg_error(std::runtime_error{"socket reset"}), ErrorKind::TransientIo);
}

TEST(PgErrors, TranslationKeepsOperationAndMessage)
{
    const PipelineError e = to_pipeline_error(pqxx::unique_violation{"duplicate key"}, "bulk load");

    EXPECT_EQ(e.kind(), ErrorKind::Conflict);
    EXPECT_NE(e.detail().find("bulk load"), std::string::npos);
    EXPECT_NE(e.detail().find("duplicate key"), std::string::npos);
}
