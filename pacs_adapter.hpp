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
#include "pacs_sanitize.hpp"
#include "pacs_parser_pugi.hpp"
#include "pacs_status.hpp"
#include "pacs_validate.hpp"
#include "pacs_ledger.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace pacs {

struct AdapterOptions {
    ParserOptions parser;
    std::shared_ptr<spdlog::logger> logger;   // nullptr => spdlog::default_logger()
};

/**
 * pacs.008 in, pacs.002 out.
 *
 * parse and generate are pure transforms over strings; the only state is
 * the statistics counters, guarded by a mutex so one instance may be
 * shared between threads.
 */
class MessageAdapter {
public:
    MessageAdapter() : MessageAdapter(AdapterOptions()) {}

    explicit MessageAdapter(AdapterOptions options)
        : parser_(std::move(options.parser)),
          log_(options.logger ? std::move(options.logger) : spdlog::default_logger()) {}

    MessageAdapter(const MessageAdapter&) = delete;
    MessageAdapter& operator=(const MessageAdapter&) = delete;

    // ---- parsing ----

    bool parse_credit_transfer(std::string_view xml, PaymentInstruction& out, Error* error = nullptr) {
        Error local;
        Error* err = error ? error : &local;

        if (has_dangerous_declarations(xml))
            log_->warn("pacs.008: stripped DOCTYPE/ENTITY declarations from inbound message");

        PaymentInstruction ins;
        if (!parser_.parse_string(xml, ins, err)) {
            log_->warn("pacs.008 rejected: {} ({})", to_string(err->kind), err->message);
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++stats_.messagesParsed;
        }
        log_->info("Parsed pacs.008: {} | {}", ins.messageId, format_amount(ins.amount));
        out = std::move(ins);
        return true;
    }

    bool parse_file(const std::string& path, PaymentInstruction& out, Error* error = nullptr) {
        Error local;
        Error* err = error ? error : &local;
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) {
            set_error(err, ErrorKind::MalformedXml, path, "", "Cannot open XML file");
            log_->warn("pacs.008 rejected: cannot open {}", path);
            return false;
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return parse_credit_transfer(buf.str(), out, err);
    }

    // ---- generation ----

    std::string generate_status_report(const StatusReport& unstamped) {
        const StatusReport report = stamped(unstamped);
        std::string xml = pacs::generate_status_report(report);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++stats_.messagesGenerated;
        }
        log_->info("Generated pacs.002: {} | Status: {}", report_message_id(report), to_string(report.status));
        return xml;
    }

    std::string generate_status_report(const PaymentInstruction& ins, TxStatus status,
                                       std::optional<std::string> reasonCode = std::nullopt,
                                       std::string additionalInfo = std::string()) {
        return generate_status_report(make_status_report(ins, status, std::move(reasonCode), std::move(additionalInfo)));
    }

    std::string generate_acknowledgment(const PaymentInstruction& ins) {
        return generate_status_report(ins, TxStatus::ACCP);
    }

    std::string generate_rejection(const PaymentInstruction& ins, const std::string& reasonCode,
                                   const std::string& additionalInfo = std::string()) {
        return generate_status_report(ins, TxStatus::RJCT, reasonCode, additionalInfo);
    }

    // ---- validation ----

    ValidationResult validate(const PaymentInstruction& ins) const {
        return validate_instruction(ins, parser_.options().currencies);
    }

    bool verify_lossless(const PaymentInstruction& original, const PaymentInstruction& reparsed,
                         Error* error = nullptr) const {
        Error local;
        Error* err = error ? error : &local;
        if (verify_lossless_translation(original, reparsed, err)) return true;
        log_->error("Lossless translation violated: {}", err->message);
        return false;
    }

    // Re-parses the audit copy and checks the critical fields against ins.
    bool verify_round_trip(const PaymentInstruction& ins, Error* error = nullptr) const {
        Error local;
        Error* err = error ? error : &local;
        PaymentInstruction again;
        if (!parser_.parse_string(ins.rawXml, again, err)) {
            // the audit copy parsed once already; failing now is an adapter defect
            err->actual = err->message;
            err->kind = ErrorKind::LosslessTranslation;
            err->message = "Re-parse of audit copy failed: " + err->actual;
            log_->error("Lossless translation violated: {}", err->message);
            return false;
        }
        return verify_lossless(ins, again, err);
    }

    CreditTransferCommand ledger_command(const PaymentInstruction& ins) const {
        return to_ledger_command(ins);
    }

    // ---- statistics ----

    AdapterStats stats() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return stats_;
    }

    void reset_stats() {
        std::lock_guard<std::mutex> lock(mtx_);
        stats_ = AdapterStats();
    }

    const ParserOptions& options() const { return parser_.options(); }

private:
    Parser parser_;
    std::shared_ptr<spdlog::logger> log_;
    mutable std::mutex mtx_;
    AdapterStats stats_;
};

} // namespace pacs
