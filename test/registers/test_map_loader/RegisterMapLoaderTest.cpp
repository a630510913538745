#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "layers/registers/RegisterMapLoader.h"

namespace registers {
namespace test {

class RegisterMapLoaderTest : public ::testing::Test {
protected:
    // Wraps a register list in a document with slave_id 1.
    static std::string document(const std::string& registersJson, const std::string& extra = {}) {
        return "{\"slave_id\": 1" + extra + ", \"registers\": [" + registersJson + "]}";
    }

    static void expectConfigError(const std::string& json, const std::string& fragment) {
        try {
            parseRegisterMap(json);
            ADD_FAILURE() << "no ConfigError for " << json;
        } catch (const ConfigError& e) {
            EXPECT_NE(std::string::npos, std::string(e.what()).find(fragment))
                << "message '" << e.what() << "' lacks '" << fragment << "'";
        }
    }
};

TEST_F(RegisterMapLoaderTest, parseRegisterMap_MinimalDocumentUsesDefaults)
{
    const auto map = parseRegisterMap(document(R"({"name": "Temp", "type": "int16", "address": 4})"));

    EXPECT_EQ(1, map.slaveId);
    EXPECT_EQ(Endianness::Big, map.endianness);
    ASSERT_EQ(1U, map.registers.size());

    const auto& reg = map.registers.front();
    EXPECT_EQ("Temp", reg.name);
    EXPECT_EQ(RegisterType::Int16, reg.type);
    EXPECT_EQ(4, reg.address);
    EXPECT_EQ(protocol::FunctionCode::ReadHoldingRegisters, reg.function);
    EXPECT_EQ(protocol::FunctionCode::WriteSingleRegister, reg.writeFunction);
    EXPECT_DOUBLE_EQ(1.0, reg.scale);
    EXPECT_EQ(1, reg.wordCount);
    EXPECT_TRUE(reg.writable);
    EXPECT_EQ("Temp", map.probe.name);
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_AcceptsAliasesAndHexAddress)
{
    const auto map = parseRegisterMap(R"({
        "slaveId": 17,
        "endianness": "little",
        "registers": [
            {"name": "Mode", "type": "enum16", "address": "0x0010", "functionCode": 4,
             "symbolMap": {"2": "Auto", "0": "Off", "0x1": "Manual"}},
            {"name": "Level", "type": "uint16", "address": 32, "bounds": [0, 100],
             "writeFunctionCode": 16, "unit": "%"}
        ]
    })");

    EXPECT_EQ(17, map.slaveId);
    EXPECT_EQ(Endianness::Little, map.endianness);

    const auto* mode = map.find("Mode");
    ASSERT_NE(nullptr, mode);
    EXPECT_EQ(0x10, mode->address);
    EXPECT_EQ(protocol::FunctionCode::ReadInputRegisters, mode->function);
    ASSERT_EQ(3U, mode->symbolMap.size());
    EXPECT_EQ(2, mode->symbolMap[0].first);
    EXPECT_EQ("Auto", mode->symbolMap[0].second);
    EXPECT_EQ(1, mode->symbolMap[2].first);

    const auto* level = map.find("Level");
    ASSERT_NE(nullptr, level);
    ASSERT_TRUE(level->minimum.has_value());
    ASSERT_TRUE(level->maximum.has_value());
    EXPECT_DOUBLE_EQ(0.0, *level->minimum);
    EXPECT_DOUBLE_EQ(100.0, *level->maximum);
    EXPECT_EQ(protocol::FunctionCode::WriteMultipleRegisters, level->writeFunction);
    EXPECT_EQ("%", level->unit);
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_FunctionByName)
{
    const auto map = parseRegisterMap(
        document(R"({"name": "A", "type": "uint16", "address": 0, "function": "read_input",
                     "write_function": "write_multiple"})"));
    EXPECT_EQ(protocol::FunctionCode::ReadInputRegisters, map.registers.front().function);
    EXPECT_EQ(protocol::FunctionCode::WriteMultipleRegisters, map.registers.front().writeFunction);

    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0, "function": "read_coils"})"),
                      "function");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0, "function": "write_single"})"),
                      "function");
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_ImpliedWordCountWins)
{
    const auto map = parseRegisterMap(document(R"({"name": "Count", "type": "uint32", "address": 0, "words": 1},
                                                  {"name": "Mac", "type": "mac48", "address": 2})"));
    EXPECT_EQ(2, map.find("Count")->wordCount);
    EXPECT_EQ(3, map.find("Mac")->wordCount);
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_ProbeByNameOrObject)
{
    const auto registersJson = R"({"name": "A", "type": "uint16", "address": 0},
                                  {"name": "Model", "type": "ascii", "address": 10, "words": 4})";

    const auto byName = parseRegisterMap(document(registersJson, R"(, "probe": "Model")"));
    EXPECT_EQ("Model", byName.probe.name);
    EXPECT_EQ(RegisterType::Ascii, byName.probe.type);

    const auto byObject = parseRegisterMap(
        document(registersJson, R"(, "probe": {"name": "Id", "type": "uint16", "address": 99, "function": 4})"));
    EXPECT_EQ("Id", byObject.probe.name);
    EXPECT_EQ(99, byObject.probe.address);
    EXPECT_EQ(2U, byObject.registers.size());

    expectConfigError(document(registersJson, R"(, "probe": "Nope")"), "Nope");
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_UnknownTypeLoadsAsUnsupported)
{
    const auto map = parseRegisterMap(document(R"({"name": "Ok", "type": "uint16", "address": 0},
                                                  {"name": "Weird", "type": "float32", "address": 1})"));
    const auto* weird = map.find("Weird");
    ASSERT_NE(nullptr, weird);
    EXPECT_EQ(RegisterType::Unsupported, weird->type);
    EXPECT_EQ("float32", weird->typeName);
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_UnsupportedProbeIsRejected)
{
    expectConfigError(document(R"({"name": "Weird", "type": "float32", "address": 1})"), "unsupported");
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_RejectsInvalidRegisters)
{
    expectConfigError(document(R"({"type": "uint16", "address": 0})"), "name");
    expectConfigError(document(R"({"name": "A", "address": 0})"), "type");
    expectConfigError(document(R"({"name": "A", "type": "uint16"})"), "address");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 70000})"), "address");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0},
                                  {"name": "A", "type": "int16", "address": 1})"), "duplicate");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0, "scale": 0})"), "scale");
    expectConfigError(document(R"({"name": "A", "type": "enum16", "address": 0})"), "map");
    expectConfigError(document(R"({"name": "A", "type": "enum16", "address": 0, "map": {}})"), "map");
    expectConfigError(document(R"({"name": "A", "type": "bitmask16", "address": 0, "map": {"x": "Bad"}})"),
                      "map key");
    expectConfigError(document(R"({"name": "A", "type": "ascii", "address": 0})"), "words");
    expectConfigError(document(R"({"name": "A", "type": "ascii", "address": 0, "words": 0})"), "words");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0, "min": 5, "max": 1})"), "min");
    expectConfigError(document(R"({"name": "A", "type": "uint32", "address": 65535})"), "65535");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0, "function": 6})"), "function");
    expectConfigError(document(R"({"name": "A", "type": "uint16", "address": 0, "write_function": 3})"),
                      "function");
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_RejectsInvalidDocument)
{
    const auto reg = R"({"name": "A", "type": "uint16", "address": 0})";
    expectConfigError(std::string("{\"slave_id\": 0, \"registers\": [") + reg + "]}", "slave_id");
    expectConfigError(std::string("{\"slave_id\": 248, \"registers\": [") + reg + "]}", "slave_id");
    expectConfigError(std::string("{\"registers\": [") + reg + "]}", "slave_id");
    expectConfigError(document(reg, R"(, "endianness": "middle")"), "endianness");
    expectConfigError(R"({"slave_id": 1, "registers": []})", "registers");
    expectConfigError("[1, 2, 3]", "object");
    expectConfigError("{not json", "Invalid JSON");
}

TEST_F(RegisterMapLoaderTest, parseRegisterMap_IgnoresUnknownFields)
{
    const auto map = parseRegisterMap(
        document(R"({"name": "A", "type": "uint16", "address": 0, "comment": "spare", "gui_row": 3})",
                 R"(, "title": "bench rig")"));
    EXPECT_EQ(1U, map.registers.size());
}

TEST_F(RegisterMapLoaderTest, loadRegisterMap_ReadsFileAndPrefixesErrors)
{
    const std::string good = ::testing::TempDir() + "qmbmon_loader_good.json";
    {
        std::ofstream out(good);
        out << document(R"({"name": "A", "type": "bool16", "address": 3, "writable": false})");
    }
    const auto map = loadRegisterMap(good);
    ASSERT_EQ(1U, map.registers.size());
    EXPECT_FALSE(map.registers.front().writable);

    const std::string bad = ::testing::TempDir() + "qmbmon_loader_bad.json";
    {
        std::ofstream out(bad);
        out << R"({"slave_id": 1, "registers": []})";
    }
    try {
        loadRegisterMap(bad);
        ADD_FAILURE() << "no ConfigError for " << bad;
    } catch (const ConfigError& e) {
        EXPECT_EQ(0U, std::string(e.what()).find(bad));
    }

    EXPECT_THROW(loadRegisterMap(::testing::TempDir() + "does_not_exist.json"), ConfigError);
}

} // namespace test
} // namespace registers
