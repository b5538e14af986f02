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
#include <pugixml.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <array>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace pacs {

constexpr const char* kPacs002Namespace = "urn:iso:std:iso:20022:tech:xsd:pacs.002.001.10";
constexpr const char* kPacs008MessageName = "pacs.008.001.08";

// ---------- Status codes ----------
inline const char* to_string(TxStatus s) {
    switch (s) {
    case TxStatus::ACCP: return "ACCP";
    case TxStatus::ACSC: return "ACSC";
    case TxStatus::ACSP: return "ACSP";
    case TxStatus::ACTC: return "ACTC";
    case TxStatus::ACWC: return "ACWC";
    case TxStatus::PDNG: return "PDNG";
    case TxStatus::RCVD: return "RCVD";
    case TxStatus::RJCT: return "RJCT";
    }
    return "";
}

inline bool parse_tx_status(std::string_view code, TxStatus& out) {
    static const std::array<TxStatus, 8> all{
        TxStatus::ACCP, TxStatus::ACSC, TxStatus::ACSP, TxStatus::ACTC,
        TxStatus::ACWC, TxStatus::PDNG, TxStatus::RCVD, TxStatus::RJCT
    };
    for (TxStatus s : all) {
        if (code == to_string(s)) { out = s; return true; }
    }
    return false;
}

inline bool is_accepted(TxStatus s) {
    return s == TxStatus::ACCP || s == TxStatus::ACSC || s == TxStatus::ACSP ||
           s == TxStatus::ACTC || s == TxStatus::ACWC;
}
inline bool is_pending(TxStatus s)  { return s == TxStatus::PDNG || s == TxStatus::RCVD; }
inline bool is_rejected(TxStatus s) { return s == TxStatus::RJCT; }

// ---------- Reason codes (ExternalStatusReason1Code subset) ----------
struct ReasonCodeInfo {
    const char* code;
    const char* description;
};

inline const std::array<ReasonCodeInfo, 14>& reason_codes() {
    static const std::array<ReasonCodeInfo, 14> t{{
        {"AC00", "Reference accepted"},
        {"AC01", "Incorrect account number"},
        {"AC04", "Closed account number"},
        {"AC06", "Blocked account"},
        {"AG01", "Transaction forbidden"},
        {"AM01", "Zero amount"},
        {"AM02", "Not allowed amount"},
        {"AM03", "Not allowed currency"},
        {"AM04", "Insufficient funds"},
        {"AM05", "Duplication"},
        {"BE01", "Inconsistent with end customer"},
        {"FF01", "Invalid file format"},
        {"RC01", "Bank identifier incorrect"},
        {"TM01", "Cut off time"},
    }};
    return t;
}

// "" for codes outside the table; such codes are still emitted verbatim
inline const char* reason_description(std::string_view code) {
    for (const ReasonCodeInfo& r : reason_codes())
        if (code == r.code) return r.description;
    return "";
}

// ---------- Report construction ----------
inline std::string new_report_id() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

// 2026-01-11T14:30:00.123Z
inline std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
    const std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms < 0 ? ms + 1000 : ms));
    return buf;
}

// Fills in a fresh report id and the current time where the caller left them unset.
inline StatusReport stamped(StatusReport r) {
    if (r.reportId.empty()) r.reportId = new_report_id();
    if (r.createdAt == std::chrono::system_clock::time_point{}) r.createdAt = std::chrono::system_clock::now();
    return r;
}

inline StatusReport make_status_report(const PaymentInstruction& ins, TxStatus status,
                                       std::optional<std::string> reasonCode = std::nullopt,
                                       std::string additionalInfo = std::string()) {
    StatusReport r;
    r.originalMessageId = ins.messageId;
    r.originalInstructionId = ins.instructionId;
    r.originalEndToEndId = ins.endToEndId;
    r.status = status;
    r.reasonCode = std::move(reasonCode);
    r.additionalInfo = std::move(additionalInfo);
    r.reportId = new_report_id();
    r.createdAt = std::chrono::system_clock::now();
    return r;
}

inline std::string report_message_id(const StatusReport& r) {
    return "PACS002-" + r.reportId.substr(0, 8);
}

// ---------- pacs.002 generation ----------
// Identical reports give identical bytes once id and time are set;
// unset ones are stamped first.
inline std::string generate_status_report(const StatusReport& report) {
    const StatusReport r = stamped(report);
    pugi::xml_document doc;
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    pugi::xml_node root = doc.append_child("Document");
    root.append_attribute("xmlns") = kPacs002Namespace;
    pugi::xml_node rpt = root.append_child("FIToFIPmtStsRpt");

    pugi::xml_node gh = rpt.append_child("GrpHdr");
    gh.append_child("MsgId").text().set(report_message_id(r).c_str());
    gh.append_child("CreDtTm").text().set(format_utc_timestamp(r.createdAt).c_str());

    pugi::xml_node tx = rpt.append_child("TxInfAndSts");
    tx.append_child("OrgnlMsgId").text().set(r.originalMessageId.c_str());
    tx.append_child("OrgnlMsgNmId").text().set(kPacs008MessageName);
    tx.append_child("OrgnlInstrId").text().set(r.originalInstructionId.c_str());
    tx.append_child("OrgnlEndToEndId").text().set(r.originalEndToEndId.c_str());
    tx.append_child("TxSts").text().set(to_string(r.status));

    // the block itself is the signal: absent = no reason, present = reason given
    if (r.reasonCode) {
        pugi::xml_node sts = tx.append_child("StsRsnInf");
        sts.append_child("Rsn").append_child("Cd").text().set(r.reasonCode->c_str());
        if (!r.additionalInfo.empty())
            sts.append_child("AddtlInf").text().set(r.additionalInfo.c_str());
    }

    std::ostringstream oss;
    doc.save(oss, "  ", pugi::format_default, pugi::encoding_utf8);
    return oss.str();
}

inline std::string generate_status_report(const PaymentInstruction& ins, TxStatus status,
                                          std::optional<std::string> reasonCode = std::nullopt,
                                          std::string additionalInfo = std::string()) {
    return generate_status_report(make_status_report(ins, status, std::move(reasonCode), std::move(additionalInfo)));
}

inline std::string generate_acknowledgment(const PaymentInstruction& ins) {
    return generate_status_report(ins, TxStatus::ACCP);
}

inline std::string generate_rejection(const PaymentInstruction& ins, const std::string& reasonCode,
                                      const std::string& additionalInfo = std::string()) {
    return generate_status_report(ins, TxStatus::RJCT, reasonCode, additionalInfo);
}

} // namespace pacs
