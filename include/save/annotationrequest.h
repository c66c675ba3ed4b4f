#ifndef ANNOTATIONREQUEST_H
#define ANNOTATIONREQUEST_H

#include <QByteArray>
#include <QString>
#include <QVector>
#include "markup/markupshape.h"

// Input handed to the annotator worker: the untouched document plus shapes to burn in
struct AnnotationRequest {
    QByteArray originalBytes;
    QVector<MarkupShape> shapes;

    // {"version":1,"original":"<base64>","shapes":[descriptor...]}
    QByteArray toJson() const;
    static bool fromJson(const QByteArray& json, AnnotationRequest* out, QString* error = nullptr);

    bool writeToFile(const QString& path, QString* error = nullptr) const;
    static bool readFromFile(const QString& path, AnnotationRequest* out, QString* error = nullptr);
};

#endif // ANNOTATIONREQUEST_H
