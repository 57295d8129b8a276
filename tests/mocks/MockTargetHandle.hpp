/**
 * @file MockTargetHandle.hpp
 * @brief Google Mock implementations of ITargetHandle and ITargetOpener
 */

#pragma once

#include "targets/ITargetHandle.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockTargetHandle : public ITargetHandle {
public:
    using VoidResult = std::expected<void, util::Error>;

    MOCK_METHOD(VoidResult, write_at, (uint64_t offset, std::span<const uint8_t> data),
                (override));
    MOCK_METHOD(VoidResult, read_at, (uint64_t offset, std::span<uint8_t> out), (override));
    MOCK_METHOD(VoidResult, sync, (), (override));
    MOCK_METHOD(uint64_t, size, (), (const, override));
    MOCK_METHOD(VoidResult, close, (), (override));

    // Helper: Create a nice mock of @p size bytes that accepts every write
    static std::unique_ptr<MockTargetHandle> CreateNiceMock(uint64_t size) {
        auto mock = std::make_unique<testing::NiceMock<MockTargetHandle>>();

        ON_CALL(*mock, write_at(testing::_, testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, read_at(testing::_, testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, sync()).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, size()).WillByDefault(testing::Return(size));
        ON_CALL(*mock, close()).WillByDefault(testing::Return(VoidResult{}));

        return mock;
    }
};

class MockTargetOpener : public ITargetOpener {
public:
    using VoidResult = std::expected<void, util::Error>;

    MOCK_METHOD((std::expected<uint64_t, util::Error>), probe_size, (const TargetSpec& target),
                (override));
    MOCK_METHOD((std::expected<std::unique_ptr<ITargetHandle>, util::Error>), open,
                (const JobRecord& job), (override));
    MOCK_METHOD(VoidResult, validate_for_resume, (const JobRecord& job), (override));
    MOCK_METHOD(VoidResult, finalize, (const JobRecord& job), (override));

    // Helper: Create a nice mock whose targets all have @p size bytes
    static std::shared_ptr<MockTargetOpener> CreateNiceMock(uint64_t size) {
        auto mock = std::make_shared<testing::NiceMock<MockTargetOpener>>();

        ON_CALL(*mock, probe_size(testing::_)).WillByDefault(testing::Return(size));
        ON_CALL(*mock, open(testing::_)).WillByDefault([size](const JobRecord&) {
            return std::expected<std::unique_ptr<ITargetHandle>, util::Error>(
                MockTargetHandle::CreateNiceMock(size));
        });
        ON_CALL(*mock, validate_for_resume(testing::_)).WillByDefault(testing::Return(VoidResult{}));
        ON_CALL(*mock, finalize(testing::_)).WillByDefault(testing::Return(VoidResult{}));

        return mock;
    }
};
