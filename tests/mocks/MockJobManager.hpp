/**
 * @file MockJobManager.hpp
 * @brief Google Mock implementation of IJobManager
 */

#pragma once

#include "services/IJobManager.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockJobManager : public IJobManager {
public:
    using VoidResult = std::expected<void, util::Error>;

    MOCK_METHOD((std::expected<std::string, util::Error>), submit, (const JobRequest& request),
                (override));
    MOCK_METHOD(VoidResult, pause, (const std::string& id), (override));
    MOCK_METHOD(VoidResult, resume, (const std::string& id), (override));
    MOCK_METHOD(VoidResult, cancel, (const std::string& id), (override));
    MOCK_METHOD(VoidResult, remove, (const std::string& id), (override));
    MOCK_METHOD((std::expected<JobSnapshot, util::Error>), get_job, (const std::string& id),
                (override));
    MOCK_METHOD((std::expected<std::vector<JobSnapshot>, util::Error>), list_jobs,
                (const JobFilter& filter), (override));
    MOCK_METHOD((std::expected<std::vector<PlanInfo>, util::Error>), list_plans, (), (override));
    MOCK_METHOD(void, set_progress_callback, (ProgressCallback callback), (override));

    // Helper: Create a nice mock where control calls succeed and listings are empty
    static std::unique_ptr<MockJobManager> CreateNiceMock() {
        auto mock = std::make_unique<testing::NiceMock<MockJobManager>>();

        ON_CALL(*mock, submit(testing::_))
            .WillByDefault(testing::Return(std::string("00000000-0000-4000-8000-000000000001")));
        ON_CALL(*mock, pause(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, resume(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, cancel(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, remove(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, list_jobs(testing::_))
            .WillByDefault(testing::Return(std::vector<JobSnapshot>{}));
        ON_CALL(*mock, list_plans()).WillByDefault(testing::Return(std::vector<PlanInfo>{}));
        ON_CALL(*mock, get_job(testing::_))
            .WillByDefault(testing::Return(std::unexpected(
                util::Error{util::ErrorKind::NotFound, "no such job"})));

        return mock;
    }
};
