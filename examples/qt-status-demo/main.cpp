#include <QCoreApplication>
#include <QFile>
#include <QStringList>
#include <QDebug>
#include <pacs_adapter.hpp>

// usage: pacs_status_demo <pacs008.xml> [reason-code [additional-info]]
// Without a reason code the message is acknowledged, otherwise rejected.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    const QStringList args = app.arguments();

    if (args.size() < 2) {
        qCritical("usage: %s <pacs008.xml> [reason-code [additional-info]]", argv[0]);
        return 2;
    }

    QFile in(args.at(1));
    if (!in.open(QIODevice::ReadOnly)) {
        qCritical() << "Cannot open" << args.at(1);
        return 1;
    }
    const QByteArray ba = in.readAll();

    pacs::MessageAdapter adapter;
    pacs::PaymentInstruction ins;
    pacs::Error err;

    if (!adapter.parse_credit_transfer(std::string_view(ba.constData(), static_cast<size_t>(ba.size())), ins, &err))
    {
        qCritical("%s: %s [%s]", pacs::to_string(err.kind), err.message.c_str(), err.field.c_str());
        return 1;
    }

    auto L = [](const char* label, int w = 22){
        return QString(label).leftJustified(w, QLatin1Char(' '));
    };
    auto S = [](const std::string& s){ return QString::fromUtf8(s.c_str()); };

    qDebug().noquote() << L("MessageId:")        << S(ins.messageId);
    qDebug().noquote() << L("InstructionId:")    << S(ins.instructionId);
    qDebug().noquote() << L("EndToEndId:")       << S(ins.endToEndId);
    qDebug().noquote() << L("TransactionId:")    << S(ins.transactionId);
    qDebug().noquote() << L("Amount:")           << S(pacs::format_amount(ins.amount));
    qDebug().noquote() << L("SettlementDate:")   << S(ins.settlementDate);
    qDebug().noquote()
        << L("Debtor:")   << S(ins.debtor.name)   << "/" << S(ins.debtor.accountId)
        << "/" << S(ins.debtorAgent.bic);
    qDebug().noquote()
        << L("Creditor:") << S(ins.creditor.name) << "/" << S(ins.creditor.accountId)
        << "/" << S(ins.creditorAgent.bic);
    qDebug().noquote() << L("Remittance:")       << S(ins.remittanceInfo);
    qDebug() << "";

    const pacs::ValidationResult vr = adapter.validate(ins);
    for (const auto& e : vr.errors)
        qWarning().noquote() << "[VALIDATION]" << S(e);

    if (!adapter.verify_round_trip(ins, &err)) {
        qCritical("%s", err.message.c_str());
        return 1;
    }

    std::string report;
    if (args.size() >= 3) {
        const std::string code = args.at(2).toStdString();
        const std::string info = args.size() >= 4 ? args.at(3).toStdString()
                                                  : std::string(pacs::reason_description(code));
        report = adapter.generate_rejection(ins, code, info);
    } else if (!vr.valid) {
        report = adapter.generate_rejection(ins, "FF01", vr.errors.front());
    } else {
        report = adapter.generate_acknowledgment(ins);
    }

    qDebug().noquote() << S(report);

    const pacs::CreditTransferCommand cmd = adapter.ledger_command(ins);
    qDebug().noquote() << L("Ledger command:") << S(cmd.command) << S(cmd.transactionId)
                       << S(cmd.fromAccount) << "->" << S(cmd.toAccount)
                       << S(cmd.amount) << S(cmd.currency);

    const pacs::AdapterStats st = adapter.stats();
    qInfo("Done. parsed=%llu generated=%llu",
          static_cast<unsigned long long>(st.messagesParsed),
          static_cast<unsigned long long>(st.messagesGenerated));
    return 0;
}
