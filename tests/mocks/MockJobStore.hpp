/**
 * @file MockJobStore.hpp
 * @brief Google Mock implementation of IJobStore
 */

#pragma once

#include "store/IJobStore.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockJobStore : public IJobStore {
public:
    using VoidResult = std::expected<void, util::Error>;

    MOCK_METHOD(VoidResult, create, (const JobRecord& record), (override));
    MOCK_METHOD((std::expected<JobRecord, util::Error>), load, (const std::string& id),
                (override));
    MOCK_METHOD(VoidResult, save_checkpoint,
                (const std::string& id, const Checkpoint& checkpoint), (override));
    MOCK_METHOD(VoidResult, set_state,
                (const std::string& id, JobState state, std::optional<util::Error> error),
                (override));
    MOCK_METHOD(VoidResult, attach_before_digests,
                (const std::string& id, const DigestSet& digests), (override));
    MOCK_METHOD(VoidResult, attach_verification,
                (const std::string& id, const VerificationResult& result), (override));
    MOCK_METHOD(VoidResult, record_warning, (const std::string& id, const std::string& warning),
                (override));
    MOCK_METHOD(VoidResult, add_active_time, (const std::string& id, double seconds),
                (override));
    MOCK_METHOD(VoidResult, set_interrupted, (const std::string& id, bool interrupted),
                (override));
    MOCK_METHOD((std::expected<std::vector<JobRecord>, util::Error>), list_jobs,
                (const JobFilter& filter), (override));
    MOCK_METHOD(VoidResult, delete_job, (const std::string& id), (override));

    // Helper: Create a nice mock where every mutation succeeds
    static std::shared_ptr<MockJobStore> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockJobStore>>();

        ON_CALL(*mock, create(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, save_checkpoint(testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, set_state(testing::_, testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, attach_before_digests(testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, attach_verification(testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, record_warning(testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, add_active_time(testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, set_interrupted(testing::_, testing::_))
            .WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, list_jobs(testing::_))
            .WillByDefault(testing::Return(std::vector<JobRecord>{}));
        ON_CALL(*mock, delete_job(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, load(testing::_))
            .WillByDefault(testing::Return(std::unexpected(
                util::Error{util::ErrorKind::NotFound, "no such job"})));

        return mock;
    }

    // Helper: Create a nice mock that forwards every call to a real store
    static std::shared_ptr<MockJobStore> CreateDelegatingMock(std::shared_ptr<IJobStore> real) {
        auto mock = std::make_shared<testing::NiceMock<MockJobStore>>();
        using testing::_;

        ON_CALL(*mock, create(_)).WillByDefault([real](const JobRecord& record) {
            return real->create(record);
        });
        ON_CALL(*mock, load(_)).WillByDefault([real](const std::string& id) {
            return real->load(id);
        });
        ON_CALL(*mock, save_checkpoint(_, _))
            .WillByDefault([real](const std::string& id, const Checkpoint& checkpoint) {
                return real->save_checkpoint(id, checkpoint);
            });
        ON_CALL(*mock, set_state(_, _, _))
            .WillByDefault(
                [real](const std::string& id, JobState state, std::optional<util::Error> error) {
                    return real->set_state(id, state, std::move(error));
                });
        ON_CALL(*mock, attach_before_digests(_, _))
            .WillByDefault([real](const std::string& id, const DigestSet& digests) {
                return real->attach_before_digests(id, digests);
            });
        ON_CALL(*mock, attach_verification(_, _))
            .WillByDefault([real](const std::string& id, const VerificationResult& result) {
                return real->attach_verification(id, result);
            });
        ON_CALL(*mock, record_warning(_, _))
            .WillByDefault([real](const std::string& id, const std::string& warning) {
                return real->record_warning(id, warning);
            });
        ON_CALL(*mock, add_active_time(_, _))
            .WillByDefault([real](const std::string& id, double seconds) {
                return real->add_active_time(id, seconds);
            });
        ON_CALL(*mock, set_interrupted(_, _))
            .WillByDefault([real](const std::string& id, bool interrupted) {
                return real->set_interrupted(id, interrupted);
            });
        ON_CALL(*mock, list_jobs(_)).WillByDefault([real](const JobFilter& filter) {
            return real->list_jobs(filter);
        });
        ON_CALL(*mock, delete_job(_)).WillByDefault([real](const std::string& id) {
            return real->delete_job(id);
        });

        return mock;
    }
};
