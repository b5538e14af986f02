/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include "pacs_validate.hpp"
#include "pacs_ledger.hpp"

#include <gtest/gtest.h>

using namespace pacs;

namespace {

  PaymentInstruction validInstruction() {
    PaymentInstruction ins;
    ins.messageId = "MSG-1";
    ins.instructionId = "INSTR-1";
    ins.endToEndId = "E2E-1";
    ins.debtor.name = "Acme Corporation";
    ins.debtor.accountId = "US33BOFA12345678901234";
    ins.creditor.name = "Global Widgets Ltd";
    ins.creditor.accountId = "GB82WEST12345698765432";
    EXPECT_TRUE(parse_decimal("50000.00", ins.amount.value));
    ins.amount.currency = "USD";
    return ins;
  }

}  // namespace

/**
 * @given a complete instruction
 * @then it validates without errors
 */
TEST(ValidateTest, CompleteInstructionIsValid) {
  auto r = validate_instruction(validInstruction());
  EXPECT_TRUE(r.valid);
  EXPECT_TRUE(r.errors.empty());
}

/**
 * @given an instruction breaking every rule
 * @when it is validated
 * @then all four problems are reported together
 */
TEST(ValidateTest, CollectsAllErrors) {
  PaymentInstruction ins;
  ins.amount.currency = "ZZZ";
  auto r = validate_instruction(ins);
  EXPECT_FALSE(r.valid);
  ASSERT_EQ(r.errors.size(), 4u);
  EXPECT_NE(r.errors[0].find("positive"), std::string::npos);
  EXPECT_NE(r.errors[1].find("ZZZ"), std::string::npos);
  EXPECT_NE(r.errors[2].find("Debtor"), std::string::npos);
  EXPECT_NE(r.errors[3].find("Creditor"), std::string::npos);
}

/**
 * @given parties identified by name only or account only
 * @then either is enough
 */
TEST(ValidateTest, PartyNeedsNameOrAccount) {
  auto ins = validInstruction();
  ins.debtor.accountId.clear();
  ins.creditor.name.clear();
  EXPECT_TRUE(validate_instruction(ins).valid);

  ins.amount.value = Decimal{-100, 2};
  auto r = validate_instruction(ins);
  EXPECT_FALSE(r.valid);
  ASSERT_EQ(r.errors.size(), 1u);
}

/**
 * @given a currency outside the defaults
 * @when the caller supplies an extended allow-list
 * @then it validates
 */
TEST(ValidateTest, UsesSuppliedAllowList) {
  auto ins = validInstruction();
  ins.amount.currency = "ARS";
  EXPECT_FALSE(validate_instruction(ins).valid);

  CurrencyAllowList list;
  ASSERT_TRUE(list.add("ARS"));
  EXPECT_TRUE(validate_instruction(ins, list).valid);
}

/**
 * @given two parses that agree on amount (at different scales) and instruction id
 * @then the translation is lossless
 */
TEST(ValidateTest, LosslessWhenCriticalFieldsMatch) {
  auto a = validInstruction();
  auto b = a;
  b.amount.value = Decimal{50000, 0};
  b.remittanceInfo = "ignored";
  Error err;
  EXPECT_TRUE(verify_lossless_translation(a, b, &err));
  EXPECT_EQ(err.kind, ErrorKind::None);
}

/**
 * @given a re-parse with a different amount
 * @when the translation is verified
 * @then the error names the field with the expected and actual values
 */
TEST(ValidateTest, AmountMismatchIsReported) {
  auto a = validInstruction();
  auto b = a;
  b.amount.value = Decimal{5000001, 2};
  Error err;
  EXPECT_FALSE(verify_lossless_translation(a, b, &err));
  EXPECT_EQ(err.kind, ErrorKind::LosslessTranslation);
  EXPECT_EQ(err.field, "amount");
  EXPECT_EQ(err.value, "50000.00 USD");
  EXPECT_EQ(err.actual, "50000.01 USD");
  EXPECT_STREQ(to_string(err.kind), "LosslessTranslationError");
}

/**
 * @given a re-parse with a different instruction id
 * @when the translation is verified
 * @then the instruction id mismatch is reported
 */
TEST(ValidateTest, InstructionIdMismatchIsReported) {
  auto a = validInstruction();
  auto b = a;
  b.instructionId = "INSTR-2";
  Error err;
  EXPECT_FALSE(verify_lossless_translation(a, b, &err));
  EXPECT_EQ(err.field, "instruction_id");
  EXPECT_EQ(err.value, "INSTR-1");
  EXPECT_EQ(err.actual, "INSTR-2");
  EXPECT_FALSE(verify_lossless_translation(a, b));
}

/**
 * @given an instruction without a transaction id
 * @when it is turned into a ledger command
 * @then the instruction id stands in and the amount keeps its scale
 */
TEST(LedgerCommandTest, MapsInstruction) {
  auto ins = validInstruction();
  ins.remittanceInfo = "Invoice 7";
  auto c = to_ledger_command(ins);
  EXPECT_EQ(c.command, "CREDIT_TRANSFER");
  EXPECT_EQ(c.transactionId, "INSTR-1");
  EXPECT_EQ(c.fromAccount, "US33BOFA12345678901234");
  EXPECT_EQ(c.toAccount, "GB82WEST12345698765432");
  EXPECT_EQ(c.amount, "50000.00");
  EXPECT_EQ(c.currency, "USD");
  EXPECT_EQ(c.reference, "E2E-1");
  EXPECT_EQ(c.memo, "Invoice 7");
  EXPECT_EQ(c.source, "ISO20022:pacs.008");
  EXPECT_EQ(c.originalMessageId, "MSG-1");

  ins.transactionId = "TX-9";
  EXPECT_EQ(to_ledger_command(ins).transactionId, "TX-9");
}
