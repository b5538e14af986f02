/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <chrono>

namespace pacs {

// --- Basis ---

// Exact decimal: value = units / 10^scale
struct Decimal {
    std::int64_t units{0};
    int scale{0};             // digits after the decimal point, as parsed
};

struct PaymentAmount {
    Decimal value;
    std::string currency;     // "USD" (Ccy attribute, upper-cased)
};

struct PaymentParty {
    std::string name;         // Nm
    std::string accountId;    // <Acct><Id><IBAN> | <Acct><Id><Othr><Id>
    std::string bic;          // BICFI/BIC, AnyBIC or ClrSysMmbId/MmbId
    std::string address;      // PstlAdr, joined into one line
    std::string country;      // PstlAdr/Ctry
};

// Canonical form of one CdtTrfTxInf
struct PaymentInstruction {
    std::string messageId;        // GrpHdr/MsgId
    std::string instructionId;    // PmtId/InstrId
    std::string endToEndId;       // PmtId/EndToEndId
    std::string transactionId;    // PmtId/UETR if present, else PmtId/TxId

    PaymentParty debtor;          // Dbtr + DbtrAcct
    PaymentParty creditor;        // Cdtr + CdtrAcct
    PaymentParty debtorAgent;     // DbtrAgt/FinInstnId
    PaymentParty creditorAgent;   // CdtrAgt/FinInstnId

    PaymentAmount amount;         // IntrBkSttlmAmt | InstdAmt

    std::string creationDateTime; // GrpHdr/CreDtTm
    std::string settlementDate;   // IntrBkSttlmDt
    std::string remittanceInfo;   // RmtInf/Ustrd[]

    std::string rawXml;           // sanitized input, kept for audit
    std::chrono::system_clock::time_point parsedAt{};   // set on successful parse
};

// ISO-20022 transaction status (TxSts)
enum class TxStatus {
    ACCP,   // accepted customer profile
    ACSC,   // accepted settlement completed
    ACSP,   // accepted settlement in process
    ACTC,   // accepted technical validation
    ACWC,   // accepted with change
    PDNG,   // pending
    RCVD,   // received
    RJCT    // rejected
};

struct StatusReport {
    std::string originalMessageId;
    std::string originalInstructionId;
    std::string originalEndToEndId;
    TxStatus status{TxStatus::RCVD};
    std::optional<std::string> reasonCode;   // StsRsnInf/Rsn/Cd, absent = no block
    std::string additionalInfo;              // StsRsnInf/AddtlInf
    std::string reportId;                    // UUID, empty = assigned on generation
    std::chrono::system_clock::time_point createdAt{};   // epoch = now on generation
};

// Generic command handed to the ledger side
struct CreditTransferCommand {
    std::string command;          // "CREDIT_TRANSFER"
    std::string transactionId;
    std::string fromAccount;
    std::string toAccount;
    std::string amount;           // decimal text, scale preserved
    std::string currency;
    std::string reference;        // end-to-end id
    std::string memo;             // remittance
    std::string source;           // provenance tag
    std::string originalMessageId;
};

// --- Errors ---
enum class ErrorKind {
    None,
    MalformedXml,          // empty, oversized, not well-formed, not UTF-8, too deep
    SchemaValidation,      // well-formed but a required element or value is missing/bad
    CurrencyValidation,    // amount currency outside the allow-list
    LosslessTranslation    // re-parse drifted from the original
};

struct Error {
    ErrorKind kind{ErrorKind::None};
    std::string field;     // element or field concerned
    std::string value;     // offending value (expected value for lossless checks)
    std::string actual;    // re-parsed value (lossless checks only)
    std::string message;
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:                return "None";
    case ErrorKind::MalformedXml:        return "MalformedXmlError";
    case ErrorKind::SchemaValidation:    return "SchemaValidationError";
    case ErrorKind::CurrencyValidation:  return "CurrencyValidationError";
    case ErrorKind::LosslessTranslation: return "LosslessTranslationError";
    }
    return "Unknown";
}

inline bool set_error(Error* error, ErrorKind kind, std::string field, std::string value, std::string message) {
    if (error) {
        error->kind = kind;
        error->field = std::move(field);
        error->value = std::move(value);
        error->actual.clear();
        error->message = std::move(message);
    }
    return false;
}

struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;   // every violated rule, in check order
};

struct AdapterStats {
    std::uint64_t messagesParsed{0};
    std::uint64_t messagesGenerated{0};
};

} // namespace pacs
