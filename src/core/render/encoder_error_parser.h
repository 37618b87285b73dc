#pragma once

#include <QJsonObject>
#include <QString>

namespace cutline {

enum class EncoderErrorReason {
    InvalidCodec,
    EncodingFailed,
    InputCorrupted,
    IncompatibleFormats,
    TimestampMismatch,
    PermissionDenied,
    DiskFull,
    OutOfMemory,
    Unknown
};

QString encoderErrorReasonToString(EncoderErrorReason reason);

struct EncoderDiagnosis {
    EncoderErrorReason reason = EncoderErrorReason::Unknown;
    QString summary;
    QString lastErrorLine;

    // Stored as error.detail of an EncoderExec failure
    QJsonObject toJson() const;
};

/**
 * Classifies the tail of encoder output after a failed run
 * First matching rule wins; rules run from most to least specific.
 */
class EncoderErrorParser
{
public:
    static EncoderDiagnosis classify(const QString& output);

    // Last line mentioning error/failed/invalid, else the last non-empty line
    static QString lastErrorLine(const QString& output);
};

} // namespace cutline
