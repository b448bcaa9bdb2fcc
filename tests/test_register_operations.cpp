/**
 * @file test_register_operations.cpp
 * @brief Tests for validated register reads and writes
 * @author RegBridge Test Team
 * @date 2025-09-06
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../cpp/include/register_operations.hpp"
#include "../cpp/include/exceptions.hpp"
#include "simulated_device.hpp"
#include <memory>

using namespace regBridge;
using namespace regBridge::testing_support;
using namespace testing;

class RegisterOperationsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = testConnection(2);
    }

    TransportFactory mockFactory() {
        return [this](const ConnectionConfig&) -> std::unique_ptr<ModbusTransport> {
            factory_calls_++;
            auto mock = std::make_unique<NiceMock<MockModbusTransport>>();
            ON_CALL(*mock, isOpen()).WillByDefault(Return(true));
            if (configure_) {
                configure_(*mock, factory_calls_);
            }
            return mock;
        };
    }

    static Parameter makeParameter(const std::string& name, DataType type, uint16_t offset,
                                   ByteOrder order = ByteOrder::AB) {
        Parameter parameter;
        parameter.name = name;
        parameter.data_type = type;
        parameter.byte_order = order;
        parameter.register_offset = offset;
        parameter.word_count = word_width(type);
        parameter.writable = true;
        return parameter;
    }

    static RegisterRange holdingRange(RegisterAddress start, uint16_t count) {
        RegisterRange range;
        range.start_address = start;
        range.count = count;
        range.function = ModbusFunction::READ_HOLDING_REGISTERS;
        return range;
    }

    ConnectionConfig config_;
    RegisterOperations operations_;
    int factory_calls_ = 0;
    std::function<void(NiceMock<MockModbusTransport>&, int)> configure_;
};

// ============================================================================
// Read Tests
// ============================================================================

TEST_F(RegisterOperationsTest, ReadParameters_DecodesEveryParameter) {
    auto device = std::make_shared<SimulatedDevice>();
    device->setHolding(100, {2305, 0xFFF6, 0x4148, 0x0000});

    RegisterRange range = holdingRange(100, 4);
    Parameter voltage = makeParameter("voltage", DataType::UINT16, 0);
    voltage.scale = 0.1;
    voltage.decimals = 1;
    voltage.unit = "V";
    Parameter offset = makeParameter("offset", DataType::INT16, 1);
    Parameter power = makeParameter("power", DataType::FLOAT32, 2, ByteOrder::ABCD);
    range.parameters = {voltage, offset, power};

    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    std::vector<RegisterValue> raw;
    auto readings = operations_.readParameters(handle, range, range.parameters, &raw);

    ASSERT_EQ(readings.size(), 3u);
    EXPECT_DOUBLE_EQ(std::get<double>(readings[0].value), 230.5);
    EXPECT_EQ(readings[0].unit, "V");
    EXPECT_EQ(std::get<int64_t>(readings[1].value), -10);
    EXPECT_DOUBLE_EQ(std::get<double>(readings[2].value), 12.5);
    EXPECT_THAT(raw, ElementsAre(2305, 0xFFF6, 0x4148, 0x0000));
}

TEST_F(RegisterOperationsTest, ReadParameters_BadParameter_MarksOnlyThatReading) {
    auto device = std::make_shared<SimulatedDevice>();
    device->setHolding(0, {1, 2});

    RegisterRange range = holdingRange(0, 2);
    Parameter good = makeParameter("good", DataType::UINT16, 0);
    Parameter outside = makeParameter("outside", DataType::UINT32, 1, ByteOrder::ABCD);
    range.parameters = {good, outside};

    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();
    auto readings = operations_.readParameters(handle, range, range.parameters);

    ASSERT_EQ(readings.size(), 2u);
    EXPECT_FALSE(readings[0].error.has_value());
    EXPECT_EQ(std::get<int64_t>(readings[0].value), 1);
    ASSERT_TRUE(readings[1].error.has_value());
    EXPECT_EQ(readings[1].error_kind, ErrorKind::PARTIAL_DECODE);
    EXPECT_FALSE(readings[1].hasValue());
}

TEST_F(RegisterOperationsTest, ReadRange_Coils_ReturnsBitsAsWords) {
    auto device = std::make_shared<SimulatedDevice>();
    device->setCoil(10, true);
    device->setCoil(12, true);

    RegisterRange range;
    range.start_address = 10;
    range.count = 3;
    range.function = ModbusFunction::READ_COILS;

    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    EXPECT_THAT(operations_.readRange(handle, range), ElementsAre(1, 0, 1));
}

TEST_F(RegisterOperationsTest, ReadRange_ShortReply_ThrowsProtocol) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        ON_CALL(mock, readHoldingRegisters(_, _))
            .WillByDefault(Return(std::vector<RegisterValue>{1, 2}));
    };

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();
    EXPECT_THROW(operations_.readRange(handle, holdingRange(0, 3)), ProtocolException);
}

TEST_F(RegisterOperationsTest, ValidateReadRequest_Limits) {
    EXPECT_NO_THROW(RegisterOperations::validateReadRequest(ModbusFunction::READ_HOLDING_REGISTERS, 0, 125));
    EXPECT_THROW(RegisterOperations::validateReadRequest(ModbusFunction::READ_HOLDING_REGISTERS, 0, 126),
                 ValidationException);
    EXPECT_THROW(RegisterOperations::validateReadRequest(ModbusFunction::READ_INPUT_REGISTERS, 0, 0),
                 ValidationException);
    EXPECT_NO_THROW(RegisterOperations::validateReadRequest(ModbusFunction::READ_COILS, 0, 2000));
    EXPECT_THROW(RegisterOperations::validateReadRequest(ModbusFunction::READ_DISCRETE_INPUTS, 0, 2001),
                 ValidationException);
    EXPECT_THROW(RegisterOperations::validateReadRequest(ModbusFunction::READ_HOLDING_REGISTERS, 65500, 100),
                 ValidationException);
    EXPECT_THROW(RegisterOperations::validateReadRequest(ModbusFunction::WRITE_SINGLE_COIL, 0, 1),
                 ValidationException);
}

TEST_F(RegisterOperationsTest, ReadRange_InvalidCount_NeverTouchesTransport) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        EXPECT_CALL(mock, readHoldingRegisters(_, _)).Times(0);
    };

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();
    EXPECT_THROW(operations_.readRange(handle, holdingRange(0, 200)), ValidationException);
}

// ============================================================================
// Retry Tests
// ============================================================================

TEST_F(RegisterOperationsTest, Execute_Timeout_ReopensAndRetries) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int call) {
        if (call == 1) {
            EXPECT_CALL(mock, readHoldingRegisters(0, 2)).WillOnce(Throw(TimeoutException("No response")));
        } else {
            EXPECT_CALL(mock, readHoldingRegisters(0, 2))
                .WillOnce(Return(std::vector<RegisterValue>{7, 8}));
        }
    };

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();

    EXPECT_THAT(operations_.readRange(handle, holdingRange(0, 2)), ElementsAre(7, 8));
    EXPECT_EQ(factory_calls_, 2);

    auto stats = operations_.getStatistics();
    EXPECT_EQ(stats.total_requests, 2u);
    EXPECT_EQ(stats.failed_requests, 1u);
    EXPECT_EQ(stats.retry_attempts, 1u);
}

TEST_F(RegisterOperationsTest, Execute_RetriesExhausted_RethrowsLastError) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        ON_CALL(mock, writeRegister(_, _)).WillByDefault(Throw(ConnectionException("Connection reset")));
    };

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();

    EXPECT_THROW(operations_.writeRegister(handle, 5, 1), ConnectionException);
    EXPECT_EQ(factory_calls_, 3);
    EXPECT_EQ(operations_.getStatistics().failed_requests, 3u);
}

TEST_F(RegisterOperationsTest, Execute_ProtocolError_NotRetried) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        EXPECT_CALL(mock, writeRegister(5, 1)).WillOnce(Throw(ProtocolException(0x02, "Illegal data address")));
    };

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();

    EXPECT_THROW(operations_.writeRegister(handle, 5, 1), ProtocolException);
    EXPECT_EQ(factory_calls_, 1);
}

// ============================================================================
// Write Tests
// ============================================================================

TEST_F(RegisterOperationsTest, WriteCoils_TransportRejectsBatch_AllElementsFailWithSameError) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        EXPECT_CALL(mock, writeCoils(20, ElementsAre(true, false, true)))
            .WillOnce(Throw(ProtocolException(0x02, "Illegal data address")));
    };

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();
    auto results = operations_.writeCoils(handle, 20, {true, false, true});

    ASSERT_EQ(results.size(), 3u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_FALSE(results[i].success);
        EXPECT_EQ(results[i].address, 20 + i);
        EXPECT_EQ(results[i].error_kind, ErrorKind::PROTOCOL);
        EXPECT_EQ(results[i].message, results[0].message);
    }
    EXPECT_THAT(results[0].message, HasSubstr("Illegal data address"));
}

TEST_F(RegisterOperationsTest, WriteCoils_Accepted_ReportsEveryCoil) {
    auto device = std::make_shared<SimulatedDevice>();
    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    auto results = operations_.writeCoils(handle, 0, {true, false});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(results[0].message, "Coil 0 set to ON");
    EXPECT_EQ(results[1].message, "Coil 1 set to OFF");
    EXPECT_TRUE(device->coil(0));
    EXPECT_EQ(device->writeCount(), 1);
}

TEST_F(RegisterOperationsTest, WriteCoils_EmptyOrOversized_ThrowsValidation) {
    auto device = std::make_shared<SimulatedDevice>();
    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    EXPECT_THROW(operations_.writeCoils(handle, 0, {}), ValidationException);
    EXPECT_THROW(operations_.writeCoils(handle, 0, std::vector<bool>(1969, true)), ValidationException);
    EXPECT_THROW(operations_.writeCoils(handle, 65535, {true, true}), ValidationException);
    EXPECT_EQ(device->writeCount(), 0);
}

TEST_F(RegisterOperationsTest, WriteRegisters_TooMany_ThrowsValidation) {
    auto device = std::make_shared<SimulatedDevice>();
    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    EXPECT_THROW(operations_.writeRegisters(handle, 0, std::vector<RegisterValue>(124, 0)), ValidationException);
    EXPECT_NO_THROW(operations_.writeRegisters(handle, 0, std::vector<RegisterValue>(123, 0)));
}

TEST_F(RegisterOperationsTest, WriteParameter_SingleWord_UsesWriteSingleRegister) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        EXPECT_CALL(mock, writeRegister(41, 500)).Times(1);
        EXPECT_CALL(mock, writeRegisters(_, _)).Times(0);
    };

    RegisterRange range = holdingRange(40, 4);
    Parameter setpoint = makeParameter("setpoint", DataType::UINT16, 1);
    setpoint.scale = 0.1;

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();
    operations_.writeParameter(handle, range, setpoint, 50.0);
}

TEST_F(RegisterOperationsTest, WriteParameter_MultiWord_UsesWriteMultipleRegisters) {
    configure_ = [](NiceMock<MockModbusTransport>& mock, int) {
        EXPECT_CALL(mock, writeRegisters(40, ElementsAre(0x0000, 0x3F80))).Times(1);
        EXPECT_CALL(mock, writeRegister(_, _)).Times(0);
    };

    RegisterRange range = holdingRange(40, 4);
    Parameter limit = makeParameter("limit", DataType::FLOAT32, 0, ByteOrder::CDAB);

    ConnectionManager manager(config_, mockFactory());
    ConnectionHandle handle = manager.connect();
    operations_.writeParameter(handle, range, limit, 1.0);
}

TEST_F(RegisterOperationsTest, WriteParameter_InputRange_ThrowsValidation) {
    auto device = std::make_shared<SimulatedDevice>();
    RegisterRange range = holdingRange(0, 2);
    range.function = ModbusFunction::READ_INPUT_REGISTERS;
    Parameter reading = makeParameter("reading", DataType::UINT16, 0);

    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    EXPECT_THROW(operations_.writeParameter(handle, range, reading, int64_t{1}), ValidationException);
    EXPECT_EQ(device->writeCount(), 0);
}

TEST_F(RegisterOperationsTest, WriteParameter_CoilRange_WritesSingleCoil) {
    auto device = std::make_shared<SimulatedDevice>();
    RegisterRange range;
    range.start_address = 8;
    range.count = 4;
    range.function = ModbusFunction::READ_COILS;
    Parameter relay = makeParameter("relay", DataType::BOOL, 2);

    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();
    operations_.writeParameter(handle, range, relay, true);

    EXPECT_TRUE(device->coil(10));
}

TEST_F(RegisterOperationsTest, WriteParameter_OutOfRangeValue_NeverTouchesTransport) {
    auto device = std::make_shared<SimulatedDevice>();
    RegisterRange range = holdingRange(0, 1);
    Parameter level = makeParameter("level", DataType::INT16, 0);

    ConnectionManager manager(config_, simulatedFactory(device));
    ConnectionHandle handle = manager.connect();

    EXPECT_THROW(operations_.writeParameter(handle, range, level, int64_t{40000}), ValueOutOfRangeException);
    EXPECT_EQ(device->writeCount(), 0);
}
