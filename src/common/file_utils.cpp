#include "common/file_utils.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/errors.hpp"

namespace basmgr {

std::string readTextFile(const QString &path, bool *existed)
{
    QFileInfo info(path);
    if (!info.exists()) {
        if (existed) {
            *existed = false;
        }
        return {};
    }
    if (existed) {
        *existed = true;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw IoError("cannot read " + path.toStdString() + ": "
                      + file.errorString().toStdString());
    }
    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw IoError("cannot read " + path.toStdString() + ": "
                      + file.errorString().toStdString());
    }
    return data.toStdString();
}

void ensureDirectory(const QString &path)
{
    if (path.isEmpty() || QDir(path).exists()) {
        return;
    }
    if (!QDir().mkpath(path)) {
        throw IoError("cannot create directory " + path.toStdString());
    }
}

void writeFileAtomically(const QString &path, const std::string &data)
{
    ensureDirectory(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw IoError("cannot write " + path.toStdString() + ": "
                      + file.errorString().toStdString());
    }
    const QByteArray bytes = QByteArray::fromStdString(data);
    if (file.write(bytes) != bytes.size()) {
        const std::string reason = file.errorString().toStdString();
        file.cancelWriting();
        throw IoError("cannot write " + path.toStdString() + ": " + reason);
    }
    if (!file.commit()) {
        throw IoError("cannot replace " + path.toStdString() + ": "
                      + file.errorString().toStdString());
    }
}

} // namespace basmgr
