// =====================================================================
//  src/liblasercam/lasercam/toolpath/host.h — Host collaborators
// =====================================================================
//
//  Services the embedding application provides to the emitters.  They
//  are passed in explicitly; the library keeps no global host state.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_HOST_H
#define LASERCAM_TOOLPATH_HOST_H

#include "../core.h"

#include <QByteArray>
#include <QSizeF>
#include <QString>

namespace lasercam {
namespace toolpath {

/// Size of the editing canvas item coordinates are expressed in
class LASERCAM_EXPORT CanvasSizeProvider {
public:
    virtual ~CanvasSizeProvider() = default;

    virtual QSizeF canvasSize() const = 0;
};

/// Stores finished output under a file name
class LASERCAM_EXPORT OutputSink {
public:
    virtual ~OutputSink() = default;

    /// @return false when the bytes could not be stored
    virtual bool persist(const QString& fileName, const QByteArray& bytes) = 0;
};

/// Canvas of a fixed size
class LASERCAM_EXPORT FixedCanvasSize : public CanvasSizeProvider {
public:
    explicit FixedCanvasSize(const QSizeF& size) : m_size(size) {}

    QSizeF canvasSize() const override { return m_size; }

private:
    QSizeF m_size;
};

/// Writes output files into a directory
class LASERCAM_EXPORT FileOutputSink : public OutputSink {
public:
    /// @param directory Base directory; file names that are absolute
    ///                  paths are used as given
    explicit FileOutputSink(const QString& directory = QString());

    bool persist(const QString& fileName, const QByteArray& bytes) override;

    /// Reason of the last failed persist()
    QString errorString() const { return m_error; }

private:
    QString m_directory;
    QString m_error;
};

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_HOST_H
