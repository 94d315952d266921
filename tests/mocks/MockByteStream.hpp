/**
 * @file MockByteStream.hpp
 * @brief GoogleMock double for the stream interface
 */

#pragma once

#include <gmock/gmock.h>

#include "ByteStream.hpp"

namespace Tether {
namespace Test {

class MockByteStream : public IByteStream {
public:
    MOCK_METHOD(IoStatus, write, (const uint8_t* data, size_t size, size_t& bytes_written), (override));
    MOCK_METHOD(IoStatus, read, (uint8_t* out, size_t max, size_t& bytes_read), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(std::string, getPeerName, (), (const, override));
    MOCK_METHOD(std::string, getLastErrorMessage, (), (const, override));

    // Accepts every write in full and never has data to read
    void acceptEverything() {
        ON_CALL(*this, write(::testing::_, ::testing::_, ::testing::_))
            .WillByDefault([](const uint8_t*, size_t size, size_t& bytes_written) {
                bytes_written = size;
                return IoStatus::Ok;
            });
        ON_CALL(*this, read(::testing::_, ::testing::_, ::testing::_))
            .WillByDefault(::testing::Return(IoStatus::WouldBlock));
        ON_CALL(*this, getPeerName())
            .WillByDefault(::testing::Return(std::string("mock:0")));
    }
};

} // namespace Test
} // namespace Tether
