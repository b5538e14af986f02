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
#include <cctype>

namespace pacs_test {

inline const std::string kSamplePacs008 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08">
  <FIToFICstmrCdtTrf>
    <GrpHdr>
      <MsgId>MSGID-2026-01-11-001</MsgId>
      <CreDtTm>2026-01-11T14:30:00.000Z</CreDtTm>
      <NbOfTxs>1</NbOfTxs>
      <SttlmInf>
        <SttlmMtd>CLRG</SttlmMtd>
      </SttlmInf>
    </GrpHdr>
    <CdtTrfTxInf>
      <PmtId>
        <InstrId>INSTR-20260111-ABC123</InstrId>
        <EndToEndId>E2E-REF-INVOICE-9876</EndToEndId>
        <TxId>TXN-UETR-550e8400-e29b</TxId>
      </PmtId>
      <IntrBkSttlmAmt Ccy="USD">50000.00</IntrBkSttlmAmt>
      <IntrBkSttlmDt>2026-01-11</IntrBkSttlmDt>
      <ChrgBr>SHAR</ChrgBr>
      <Dbtr>
        <Nm>Acme Corporation</Nm>
        <PstlAdr>
          <StrtNm>123 Business Ave</StrtNm>
          <TwnNm>New York</TwnNm>
          <Ctry>US</Ctry>
        </PstlAdr>
      </Dbtr>
      <DbtrAcct>
        <Id>
          <IBAN>US33BOFA12345678901234</IBAN>
        </Id>
      </DbtrAcct>
      <DbtrAgt>
        <FinInstnId>
          <BICFI>BABORUSNYXXX</BICFI>
          <Nm>Bank of America</Nm>
        </FinInstnId>
      </DbtrAgt>
      <CdtrAgt>
        <FinInstnId>
          <BICFI>CITIUS33XXX</BICFI>
          <Nm>Citibank NA</Nm>
        </FinInstnId>
      </CdtrAgt>
      <Cdtr>
        <Nm>Global Widgets Ltd</Nm>
        <PstlAdr>
          <StrtNm>456 Commerce St</StrtNm>
          <TwnNm>London</TwnNm>
          <Ctry>GB</Ctry>
        </PstlAdr>
      </Cdtr>
      <CdtrAcct>
        <Id>
          <IBAN>GB82WEST12345698765432</IBAN>
        </Id>
      </CdtrAcct>
      <RmtInf>
        <Ustrd>Payment for Invoice INV-2026-9876</Ustrd>
      </RmtInf>
    </CdtTrfTxInf>
  </FIToFICstmrCdtTrf>
</Document>
)";

inline std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    for (size_t pos = 0; (pos = s.find(from, pos)) != std::string::npos; pos += to.size())
        s.replace(pos, from.size(), to);
    return s;
}

// Same message with a different block in place of `from`
inline std::string sample_with(const std::string& from, const std::string& to) {
    return replace_all(kSamplePacs008, from, to);
}

// Puts every element under `prefix:` and binds the prefix instead of the default namespace
inline std::string prefixed(const std::string& xml, const std::string& prefix) {
    std::string out;
    out.reserve(xml.size() * 2);
    for (size_t i = 0; i < xml.size(); ++i) {
        out.push_back(xml[i]);
        if (xml[i] != '<' || i + 1 >= xml.size()) continue;
        if (xml[i + 1] == '/') {
            out.push_back('/');
            ++i;
            out += prefix + ":";
        } else if (std::isalpha(static_cast<unsigned char>(xml[i + 1]))) {
            out += prefix + ":";
        }
    }
    return replace_all(out, "xmlns=", "xmlns:" + prefix + "=");
}

} // namespace pacs_test
