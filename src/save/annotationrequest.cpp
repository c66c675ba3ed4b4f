#include "save/annotationrequest.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

namespace {
constexpr int kRequestVersion = 1;

bool fail(QString* error, const QString& message)
{
    if (error) *error = message;
    return false;
}
} // namespace

QByteArray AnnotationRequest::toJson() const
{
    QJsonArray list;
    for (const MarkupShape& s : shapes) {
        list.append(s.toDescriptor());
    }
    QJsonObject root;
    root["version"] = kRequestVersion;
    root["original"] = QString::fromLatin1(originalBytes.toBase64());
    root["shapes"] = list;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool AnnotationRequest::fromJson(const QByteArray& json, AnnotationRequest* out, QString* error)
{
    if (!out) return fail(error, "No output request");

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(error, QString("Malformed request: %1").arg(parseError.errorString()));
    }

    const QJsonObject root = doc.object();
    if (root.value("version").toInt() != kRequestVersion) {
        return fail(error, QString("Unsupported request version %1").arg(root.value("version").toInt()));
    }

    AnnotationRequest req;
    const QByteArray b64 = root.value("original").toString().toLatin1();
    auto decoded = QByteArray::fromBase64Encoding(b64, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return fail(error, "Document bytes are not valid base64");
    }
    req.originalBytes = *decoded;
    if (req.originalBytes.isEmpty()) {
        return fail(error, "Request carries no document");
    }

    const QJsonArray list = root.value("shapes").toArray();
    for (int i = 0; i < list.size(); ++i) {
        MarkupShape s;
        if (!MarkupShape::fromDescriptor(list.at(i).toObject(), &s)) {
            return fail(error, QString("Shape %1 is malformed").arg(i));
        }
        req.shapes.append(s);
    }

    *out = req;
    return true;
}

bool AnnotationRequest::writeToFile(const QString& path, QString* error) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(error, QString("Cannot write %1: %2").arg(path, file.errorString()));
    }
    const QByteArray json = toJson();
    if (file.write(json) != json.size() || !file.commit()) {
        return fail(error, QString("Cannot write %1: %2").arg(path, file.errorString()));
    }
    return true;
}

bool AnnotationRequest::readFromFile(const QString& path, AnnotationRequest* out, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(error, QString("Cannot read %1: %2").arg(path, file.errorString()));
    }
    return fromJson(file.readAll(), out, error);
}
