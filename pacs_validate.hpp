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
#include <string>

namespace pacs {

// Collects every violated rule, not only the first one.
inline ValidationResult validate_instruction(const PaymentInstruction& ins,
                                             const CurrencyAllowList& currencies = CurrencyAllowList()) {
    ValidationResult r;

    if (!is_positive(ins.amount.value))
        r.errors.push_back("Amount must be positive (got " + format_decimal(ins.amount.value) + ")");

    if (!currencies.contains(ins.amount.currency))
        r.errors.push_back("Invalid currency: '" + ins.amount.currency + "'");

    if (ins.debtor.accountId.empty() && ins.debtor.name.empty())
        r.errors.push_back("Debtor information missing (no account id or name)");

    if (ins.creditor.accountId.empty() && ins.creditor.name.empty())
        r.errors.push_back("Creditor information missing (no account id or name)");

    r.valid = r.errors.empty();
    return r;
}

// Critical fields of two parses of the same bytes must be identical.
// A failure here is a parser defect, never an input problem.
inline bool verify_lossless_translation(const PaymentInstruction& original,
                                        const PaymentInstruction& reparsed,
                                        Error* error = nullptr) {
    auto fail = [&](const char* field, std::string expected, std::string actual) {
        if (error) {
            error->kind = ErrorKind::LosslessTranslation;
            error->field = field;
            error->message = std::string(field) + " mismatch: '" + expected + "' != '" + actual + "'";
            error->value = std::move(expected);
            error->actual = std::move(actual);
        }
        return false;
    };

    if (original.amount != reparsed.amount)
        return fail("amount", format_amount(original.amount), format_amount(reparsed.amount));

    if (original.instructionId != reparsed.instructionId)
        return fail("instruction_id", original.instructionId, reparsed.instructionId);

    return true;
}

} // namespace pacs
