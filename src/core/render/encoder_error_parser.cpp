#include "encoder_error_parser.h"

#include <QRegularExpression>
#include <QStringList>

namespace cutline {

QString encoderErrorReasonToString(EncoderErrorReason reason)
{
    switch (reason) {
    case EncoderErrorReason::InvalidCodec:        return QStringLiteral("InvalidCodec");
    case EncoderErrorReason::EncodingFailed:      return QStringLiteral("EncodingFailed");
    case EncoderErrorReason::InputCorrupted:      return QStringLiteral("InputCorrupted");
    case EncoderErrorReason::IncompatibleFormats: return QStringLiteral("IncompatibleFormats");
    case EncoderErrorReason::TimestampMismatch:   return QStringLiteral("TimestampMismatch");
    case EncoderErrorReason::PermissionDenied:    return QStringLiteral("PermissionDenied");
    case EncoderErrorReason::DiskFull:            return QStringLiteral("DiskFull");
    case EncoderErrorReason::OutOfMemory:         return QStringLiteral("OutOfMemory");
    case EncoderErrorReason::Unknown:             return QStringLiteral("Unknown");
    }
    return QStringLiteral("Unknown");
}

QJsonObject EncoderDiagnosis::toJson() const
{
    QJsonObject json;
    json["reason"] = encoderErrorReasonToString(reason);
    json["summary"] = summary;
    json["last_error_line"] = lastErrorLine;
    return json;
}

EncoderDiagnosis EncoderErrorParser::classify(const QString& output)
{
    EncoderDiagnosis diagnosis;

    if (output.trimmed().isEmpty()) {
        diagnosis.summary = QStringLiteral("Encoder failed with no output");
        return diagnosis;
    }

    const QString lower = output.toLower();
    diagnosis.lastErrorLine = lastErrorLine(output);

    if (lower.contains("unknown codec") || lower.contains("codec not found")
        || lower.contains("unknown encoder") || lower.contains("unknown decoder")) {
        static const QRegularExpression codecPattern(
            QStringLiteral("(?:codec|encoder|decoder)[:\\s]+['\"]?([a-z0-9_]+)"),
            QRegularExpression::CaseInsensitiveOption);
        diagnosis.reason = EncoderErrorReason::InvalidCodec;
        diagnosis.summary = QStringLiteral("Requested codec not supported");
        const QRegularExpressionMatch match = codecPattern.match(diagnosis.lastErrorLine);
        if (match.hasMatch()) {
            diagnosis.summary += QString(": %1").arg(match.captured(1));
        }
    } else if (lower.contains("no space left") || lower.contains("disk full")) {
        diagnosis.reason = EncoderErrorReason::DiskFull;
        diagnosis.summary = QStringLiteral("Output disk is full");
    } else if (lower.contains("permission denied") || lower.contains("access denied")) {
        diagnosis.reason = EncoderErrorReason::PermissionDenied;
        diagnosis.summary = QStringLiteral("Permission denied reading input or writing output");
    } else if (lower.contains("out of memory") || lower.contains("cannot allocate")) {
        diagnosis.reason = EncoderErrorReason::OutOfMemory;
        diagnosis.summary = QStringLiteral("Insufficient memory to encode");
    } else if (lower.contains("invalid data") || lower.contains("invalid file")
               || lower.contains("moov atom not found")) {
        diagnosis.reason = EncoderErrorReason::InputCorrupted;
        diagnosis.summary = QStringLiteral("Source file is corrupted or invalid");
    } else if (lower.contains("could not write header") || lower.contains("incompatible")) {
        diagnosis.reason = EncoderErrorReason::IncompatibleFormats;
        diagnosis.summary = QStringLiteral("Input formats are incompatible");
    } else if (lower.contains("encoding failed") || (lower.contains("encoder") && lower.contains("error"))) {
        diagnosis.reason = EncoderErrorReason::EncodingFailed;
        diagnosis.summary = QStringLiteral("Video encoding failed");
    } else if (lower.contains("pts") && (lower.contains("dts") || lower.contains("timestamp"))) {
        diagnosis.reason = EncoderErrorReason::TimestampMismatch;
        diagnosis.summary = QStringLiteral("Audio/video timestamp mismatch");
    } else {
        diagnosis.summary = QStringLiteral("Encoder processing failed");
    }

    return diagnosis;
}

QString EncoderErrorParser::lastErrorLine(const QString& output)
{
    static const QRegularExpression lineBreak(QStringLiteral("[\\r\\n]+"));
    const QStringList lines = output.split(lineBreak, Qt::SkipEmptyParts);

    for (int i = lines.size() - 1; i >= 0; --i) {
        const QString line = lines[i].toLower();
        if (line.contains("error") || line.contains("failed") || line.contains("invalid")) {
            return lines[i].trimmed();
        }
    }

    for (int i = lines.size() - 1; i >= 0; --i) {
        if (!lines[i].trimmed().isEmpty()) {
            return lines[i].trimmed();
        }
    }
    return QString();
}

} // namespace cutline
