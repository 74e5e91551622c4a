//===- RegisterModelTest.cpp - Unit tests for RegisterModel ---------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/Transaction.h"
#include "gtest/gtest.h"
#include <string>

using namespace spiv;
using namespace spiv::verif;

namespace {

std::string errorText(llvm::Error err) { return llvm::toString(std::move(err)); }

const char *kSmallMap = R"({
  "regs": {
    "MODE_ADDR": {"addr": 2, "bit_width": 4, "r_w": 1, "reg_value": 0},
    "CHIP_ID_ADDR": {"addr": 0, "bit_width": 8, "r_w": 0},
    "STATUS_ADDR": {"addr": 5, "bit_width": 6, "r_w": "ro",
                    "unsupported": true},
    "CLK_DIV_ADDR": {"addr": 3, "bit_width": 12, "reg_value": 100}
  }
})";

//===----------------------------------------------------------------------===//
// Loading
//===----------------------------------------------------------------------===//

TEST(RegisterModelTest, LoadSortsByAddress) {
  auto modelOrErr = RegisterModel::loadFromJSON(kSmallMap);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));

  auto names = modelOrErr->getNames();
  ASSERT_EQ(names.size(), 4u);
  EXPECT_EQ(names[0], "CHIP_ID_ADDR");
  EXPECT_EQ(names[1], "MODE_ADDR");
  EXPECT_EQ(names[2], "CLK_DIV_ADDR");
  EXPECT_EQ(names[3], "STATUS_ADDR");

  const RegisterEntry *mode = modelOrErr->lookup("MODE_ADDR");
  ASSERT_NE(mode, nullptr);
  EXPECT_EQ(mode->address, 2u);
  EXPECT_EQ(mode->getMaxValue(), 15u);
  EXPECT_FALSE(mode->isReadOnly());

  const RegisterEntry *status = modelOrErr->lookupByAddress(5);
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->name, "STATUS_ADDR");
  EXPECT_TRUE(status->isReadOnly());
  EXPECT_TRUE(status->unsupported);

  // r_w defaults to read-write.
  EXPECT_FALSE(modelOrErr->lookup("CLK_DIV_ADDR")->isReadOnly());
  EXPECT_EQ(modelOrErr->lookup("NOPE"), nullptr);
}

TEST(RegisterModelTest, ChipIdResetValue) {
  RegisterMapOptions options;
  options.chipAddress = 2;
  options.chipId = 5;
  auto modelOrErr = RegisterModel::loadFromJSON(kSmallMap, options);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));
  EXPECT_EQ(modelOrErr->predictRead("CHIP_ID_ADDR"), 0x52u);
}

TEST(RegisterModelTest, ChipIdMustFit) {
  const char *json = R"({"regs": {"CHIP_ID_ADDR": {"addr": 0,
                                                    "bit_width": 4}}})";
  auto modelOrErr = RegisterModel::loadFromJSON(json);
  ASSERT_FALSE(static_cast<bool>(modelOrErr));
  EXPECT_NE(errorText(modelOrErr.takeError()).find("does not fit"),
            std::string::npos);
}

TEST(RegisterModelTest, ArrayExpansion) {
  const char *json = R"({
    "regs": {
      "DAC_ADDR": {"addr": 16, "bit_width": 10, "n_regs": 3,
                   "reg_value": 512}
    }
  })";
  auto modelOrErr = RegisterModel::loadFromJSON(json);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));
  ASSERT_EQ(modelOrErr->size(), 3u);

  for (unsigned i = 0; i < 3; ++i) {
    std::string name = "DAC_" + std::to_string(i) + "_ADDR";
    const RegisterEntry *reg = modelOrErr->lookup(name);
    ASSERT_NE(reg, nullptr) << name;
    EXPECT_EQ(reg->address, 16u + i);
    EXPECT_EQ(reg->bitWidth, 10u);
    EXPECT_EQ(reg->resetValue, 512u);
  }
}

TEST(RegisterModelTest, GroupedArrayExpansion) {
  const char *json = R"({
    "regs": {
      "MBIST_RES_ADDR": {"addr": 32, "r_w": 0, "bit_width": 8, "n_regs": 6,
                         "group_widths": [12, 9, 9]}
    }
  })";
  auto modelOrErr = RegisterModel::loadFromJSON(json);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));
  ASSERT_EQ(modelOrErr->size(), 6u);

  const RegisterEntry *first = modelOrErr->lookup("MBIST_RES0_0_ADDR");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->address, 32u);
  EXPECT_EQ(first->bitWidth, 12u);
  EXPECT_TRUE(first->isReadOnly());

  const RegisterEntry *last = modelOrErr->lookup("MBIST_RES1_2_ADDR");
  ASSERT_NE(last, nullptr);
  EXPECT_EQ(last->address, 37u);
  EXPECT_EQ(last->bitWidth, 9u);
}

TEST(RegisterModelTest, GroupSizeMustDivideCount) {
  const char *json = R"({"regs": {"G_ADDR": {"addr": 0, "bit_width": 8,
                          "n_regs": 4, "group_widths": [8, 8, 8]}}})";
  auto modelOrErr = RegisterModel::loadFromJSON(json);
  ASSERT_FALSE(static_cast<bool>(modelOrErr));
  EXPECT_NE(errorText(modelOrErr.takeError()).find("not a multiple"),
            std::string::npos);
}

TEST(RegisterModelTest, RejectsBadMaps) {
  const char *cases[] = {
      "not json",
      "[1, 2]",
      R"({"registers": {}})",
      R"({"regs": {"A": {"bit_width": 8}}})",
      R"({"regs": {"A": {"addr": 300, "bit_width": 8}}})",
      R"({"regs": {"A": {"addr": 1, "bit_width": 17}}})",
      R"({"regs": {"A": {"addr": 1, "bit_width": 4, "reg_value": 16}}})",
      R"({"regs": {"A": {"addr": 1, "bit_width": 4, "r_w": 2}}})",
      R"({"regs": {"A": {"addr": 1, "bit_width": 4},
                   "B": {"addr": 1, "bit_width": 4}}})",
      R"({"regs": {"A_ADDR": {"addr": 254, "bit_width": 4, "n_regs": 4}}})",
  };
  for (const char *json : cases) {
    auto modelOrErr = RegisterModel::loadFromJSON(json);
    EXPECT_FALSE(static_cast<bool>(modelOrErr)) << json;
    if (!modelOrErr)
      llvm::consumeError(modelOrErr.takeError());
  }
}

TEST(RegisterModelTest, MissingFile) {
  auto modelOrErr = RegisterModel::loadFromFile("/nonexistent/regs.json");
  ASSERT_FALSE(static_cast<bool>(modelOrErr));
  EXPECT_NE(errorText(modelOrErr.takeError()).find("/nonexistent/regs.json"),
            std::string::npos);
}

//===----------------------------------------------------------------------===//
// Run-time state
//===----------------------------------------------------------------------===//

TEST(RegisterModelTest, WritesAndPredictions) {
  auto modelOrErr = RegisterModel::loadFromJSON(kSmallMap);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));
  RegisterModel &model = *modelOrErr;

  EXPECT_EQ(model.predictRead("CLK_DIV_ADDR"), 100u);
  EXPECT_FALSE(static_cast<bool>(model.recordWrite("CLK_DIV_ADDR", 7)));
  EXPECT_EQ(model.predictRead("CLK_DIV_ADDR"), 7u);

  // Unsupported registers are never predicted.
  EXPECT_EQ(model.predictRead("STATUS_ADDR"), std::nullopt);
  EXPECT_EQ(model.predictRead("NOPE"), std::nullopt);

  model.clearWrittenValues();
  EXPECT_EQ(model.predictRead("CLK_DIV_ADDR"), 100u);
}

TEST(RegisterModelTest, RejectedWrites) {
  auto modelOrErr = RegisterModel::loadFromJSON(kSmallMap);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));
  RegisterModel &model = *modelOrErr;

  EXPECT_NE(errorText(model.recordWrite("CHIP_ID_ADDR", 1)).find("read-only"),
            std::string::npos);
  EXPECT_NE(errorText(model.recordWrite("MODE_ADDR", 16)).find("exceeds"),
            std::string::npos);
  EXPECT_NE(errorText(model.recordWrite("NOPE", 0)).find("unknown"),
            std::string::npos);
  EXPECT_EQ(model.predictRead("MODE_ADDR"), 0u);
}

TEST(RegisterModelTest, UnderExercised) {
  auto modelOrErr = RegisterModel::loadFromJSON(kSmallMap);
  ASSERT_TRUE(static_cast<bool>(modelOrErr));
  RegisterModel &model = *modelOrErr;

  model.recordAccess("MODE_ADDR", Direction::Write);
  model.recordAccess("MODE_ADDR", Direction::Write);
  model.recordAccess("MODE_ADDR", Direction::Read);
  model.recordAccess("CHIP_ID_ADDR", Direction::Read);
  model.recordAccess("CHIP_ID_ADDR", Direction::Read);

  EXPECT_EQ(model.lookup("MODE_ADDR")->getAccessCount(Direction::Write), 2u);

  auto writes = model.getUnderExercised(Direction::Write, 2);
  ASSERT_EQ(writes.size(), 1u);
  EXPECT_EQ(writes[0], "CLK_DIV_ADDR");

  auto reads = model.getUnderExercised(Direction::Read, 2);
  ASSERT_EQ(reads.size(), 3u);
  EXPECT_EQ(reads[0], "MODE_ADDR");
}

TEST(RegisterModelTest, AddRegisterChecksLayout) {
  RegisterModel model;
  RegisterEntry a;
  a.name = "A";
  a.address = 1;
  a.bitWidth = 8;
  EXPECT_FALSE(static_cast<bool>(model.addRegister(a)));

  RegisterEntry clash = a;
  clash.name = "B";
  EXPECT_NE(errorText(model.addRegister(clash)).find("reuses address"),
            std::string::npos);
  EXPECT_NE(errorText(model.addRegister(a)).find("duplicate"),
            std::string::npos);
  EXPECT_EQ(model.size(), 1u);
}

TEST(RegisterModelTest, DirectionAndRangeNames) {
  EXPECT_EQ(parseDirection("WRITE"), Direction::Write);
  EXPECT_EQ(parseDirection("r"), Direction::Read);
  EXPECT_EQ(parseDirection("x"), std::nullopt);

  EXPECT_EQ(getAllDataRanges().size(), 5u);
  for (DataRange range : getAllDataRanges())
    EXPECT_EQ(parseDataRange(getDataRangeName(range)), range);
  EXPECT_EQ(parseDataRange("Huge"), std::nullopt);
}

TEST(TransactionTest, Fields) {
  Transaction trx;
  trx.registerName = "MODE_ADDR";
  trx.address = 2;
  trx.data = 15;
  trx.direction = Direction::Write;
  trx.dataRange = DataRange::Max0;

  EXPECT_EQ(trx.getField("register_name"), std::string("MODE_ADDR"));
  EXPECT_EQ(trx.getField("data"), std::string("15"));
  EXPECT_EQ(trx.getField("direction"), std::string("Write"));
  EXPECT_EQ(trx.getField("data_range"), std::string("Max0"));
  EXPECT_EQ(trx.getField("expected_read_value"), std::nullopt);
  EXPECT_EQ(trx.getField("color"), std::nullopt);

  std::string text;
  llvm::raw_string_ostream os(text);
  os << trx;
  os.flush();
  EXPECT_EQ(text, "Write MODE_ADDR @0x02 data=0x000f (Max0)");
}

} // namespace
