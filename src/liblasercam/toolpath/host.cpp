// =====================================================================
//  src/liblasercam/toolpath/host.cpp — Host collaborators
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/host.h>
#include <lasercam/log.h>

#include <QDir>
#include <QFile>

namespace lasercam {
namespace toolpath {

FileOutputSink::FileOutputSink(const QString& directory)
    : m_directory(directory)
{
}

bool FileOutputSink::persist(const QString& fileName, const QByteArray& bytes)
{
    QString path = fileName;
    if (!m_directory.isEmpty() && QDir::isRelativePath(fileName)) {
        path = QDir(m_directory).filePath(fileName);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QStringLiteral("Failed to open %1: %2").arg(path, file.errorString());
        qCWarning(lcToolpath) << m_error;
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        m_error = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        qCWarning(lcToolpath) << m_error;
        return false;
    }

    m_error.clear();
    qCDebug(lcToolpath) << "Wrote" << bytes.size() << "bytes to" << path;
    return true;
}

}  // namespace toolpath
}  // namespace lasercam
