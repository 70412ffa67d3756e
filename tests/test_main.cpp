// Catch2WithMain provides main(); this file holds the checks on the shared types.

#include <catch2/catch_test_macros.hpp>
#include "sideload/api/TransferTypes.hpp"

#include <cstring>
#include <memory>

using namespace sideload;

TEST_CASE("TransferTask - status only moves forward", "[types]") {
    TransferTask task;
    REQUIRE(task.status == TransferStatus::Pending);

    REQUIRE(task.advance(TransferStatus::Probing));
    REQUIRE(task.advance(TransferStatus::Streaming));
    REQUIRE_FALSE(task.advance(TransferStatus::Probing));
    REQUIRE(task.status == TransferStatus::Streaming);

    // Skipping ahead to a terminal state is allowed, leaving it is not
    REQUIRE(task.advance(TransferStatus::Failed));
    REQUIRE(task.isTerminal());
    REQUIRE_FALSE(task.advance(TransferStatus::Cancelled));
    REQUIRE(task.status == TransferStatus::Failed);
}

TEST_CASE("CancellationToken - latches", "[types][cancel]") {
    auto token = std::make_shared<CancellationToken>();
    REQUIRE_FALSE(token->isCancelled());
    token->cancel();
    token->cancel();
    REQUIRE(token->isCancelled());
}

TEST_CASE("TransferProgress - unknown size", "[types]") {
    TransferProgress progress;
    REQUIRE_FALSE(progress.sizeKnown());
    progress.totalBytes = 0;
    REQUIRE_FALSE(progress.sizeKnown());
    progress.totalBytes = 10;
    REQUIRE(progress.sizeKnown());
}

TEST_CASE("Enum names", "[types]") {
    REQUIRE(std::strcmp(toString(TransferError::CorruptDownload), "CorruptDownload") == 0);
    REQUIRE(std::strcmp(toString(TransferStatus::Verifying), "Verifying") == 0);
    REQUIRE(std::strcmp(toString(OutcomeKind::NothingToResume), "NothingToResume") == 0);
    REQUIRE(std::strcmp(toString(MessageClass::PermissionSettings), "PermissionSettings") == 0);
}
