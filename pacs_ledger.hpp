/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "pacs_model.hpp"
#include "pacs_currency.hpp"

namespace pacs {

constexpr const char* kCreditTransferCommand = "CREDIT_TRANSFER";
constexpr const char* kLedgerSourceTag = "ISO20022:pacs.008";

// Shape expected by the settlement side; not interpreted here.
inline CreditTransferCommand to_ledger_command(const PaymentInstruction& ins) {
    CreditTransferCommand c;
    c.command = kCreditTransferCommand;
    c.transactionId = ins.transactionId.empty() ? ins.instructionId : ins.transactionId;
    c.fromAccount = ins.debtor.accountId;
    c.toAccount = ins.creditor.accountId;
    c.amount = format_decimal(ins.amount.value);
    c.currency = ins.amount.currency;
    c.reference = ins.endToEndId;
    c.memo = ins.remittanceInfo;
    c.source = kLedgerSourceTag;
    c.originalMessageId = ins.messageId;
    return c;
}

} // namespace pacs
