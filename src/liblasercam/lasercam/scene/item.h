// =====================================================================
//  src/liblasercam/lasercam/scene/item.h — Canvas items
// =====================================================================
//
//  The items a scene holds: parametric parts, free-hand drawings,
//  text, bitmap images and groups.  Each item has a stable id and
//  belongs to exactly one layer.  Items are values; the scene replaces
//  them wholesale on update.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_SCENE_ITEM_H
#define LASERCAM_SCENE_ITEM_H

#include "../geometry/types.h"
#include "../importer/importer.h"

#include <QImage>
#include <QMap>
#include <QString>

#include <variant>
#include <vector>

namespace lasercam {
namespace scene {

// =====================================================================
//  Printing methods
// =====================================================================

/// How a layer is lowered to machine instructions
enum class PrintingMethod {
    Scan,       ///< Raster sweep with power modulation
    Engrave     ///< Vector path following at constant power
};

/// "scan" / "engrave"
LASERCAM_EXPORT QString printingMethodName(PrintingMethod method);

/// Parse "scan" / "engrave" (case-insensitive)
LASERCAM_EXPORT std::optional<PrintingMethod> printingMethodFromName(const QString& name);

// =====================================================================
//  Parametric parts
// =====================================================================

/// Catalog of parametric parts
enum class PartType {
    Rectangle,
    Circle,
    Line,
    Flange,
    Torus,
    LBracket,
    UChannel,
    RectangleWithHoles,
    CircleWithHoles,
    EquilateralTriangle,
    IsoscelesRightTriangle,
    Sector,
    Arc,
    Polyline
};

/// Named numeric parameters of a part (millimeters or degrees)
using PartParameters = QMap<QString, double>;

/// Catalog name ("RECTANGLE", "L_BRACKET", ...)
LASERCAM_EXPORT QString partTypeName(PartType type);

/// Parse a catalog name (case-insensitive)
LASERCAM_EXPORT std::optional<PartType> partTypeFromName(const QString& name);

/// Every part type in catalog order
LASERCAM_EXPORT QVector<PartType> allPartTypes();

/// Default parameters of a part type
LASERCAM_EXPORT PartParameters defaultParameters(PartType type);

/// A parametric part centered at (x, y)
struct LASERCAM_EXPORT Part {
    PartType type = PartType::Rectangle;
    PartParameters parameters;
    double x = 0.0;
    double y = 0.0;
    double rotation = 0.0;     ///< Degrees, around (x, y)

    /// Parameter value, falling back to the catalog default
    double parameter(const QString& name) const;
};

// =====================================================================
//  Whiteboard items
// =====================================================================

/// Free-hand or imported polyline; points are relative to (x, y)
struct LASERCAM_EXPORT Drawing {
    QVector<QPointF> points;
    double x = 0.0;
    double y = 0.0;
    QString color = QString::fromLatin1(importer::DEFAULT_STROKE_COLOR);
    double strokeWidth = 2.0;
    std::optional<QString> fillColor;
    double rotation = 0.0;

    /// Points in the parent frame (rotation about (x, y) applied)
    QVector<QPointF> absolutePoints() const;
};

/// A line of text anchored at (x, y)
struct LASERCAM_EXPORT TextObject {
    QString text;
    double fontSize = 24.0;
    QString color = QStringLiteral("#000000");
    double x = 0.0;
    double y = 0.0;
    double rotation = 0.0;
};

/// Original vector document behind an image preview
struct LASERCAM_EXPORT VectorSource {
    importer::SourceFormat format = importer::SourceFormat::Unknown;
    QString content;
};

/// Bitmap centered at (x, y)
struct LASERCAM_EXPORT ImageObject {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    QImage pixels;
    double rotation = 0.0;
    std::optional<VectorSource> vectorSource;
};

struct CanvasItem;

/// Items moved and rotated together; children are relative to (x, y)
struct LASERCAM_EXPORT GroupObject {
    std::vector<CanvasItem> children;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;
};

/// The closed set of item payloads
using ItemShape = std::variant<Part, Drawing, TextObject, ImageObject, GroupObject>;

/// Discriminator of ItemShape
enum class ItemKind {
    Part,
    Drawing,
    Text,
    Image,
    Group
};

/// An item in the scene
struct LASERCAM_EXPORT CanvasItem {
    QString id;
    QString layerId;
    ItemShape shape;

    ItemKind kind() const;

    /// Position of the item's anchor
    QPointF position() const;

    /// Rotation in degrees
    double rotation() const;
};

/// Kind of an item payload
LASERCAM_EXPORT ItemKind itemKind(const ItemShape& shape);

/// Display name of a payload ("DRAWING", "IMAGE", "GROUP", or the part type)
LASERCAM_EXPORT QString itemKindName(const ItemShape& shape);

/// Printing method an item is routed to: images scan, everything else engraves
LASERCAM_EXPORT PrintingMethod printingMethodFor(const ItemShape& shape);

/// Same shape moved to a new anchor
LASERCAM_EXPORT ItemShape withPosition(const ItemShape& shape, const QPointF& position);

/// Local transform of a payload: translate(x, y) * rotate(rotation)
LASERCAM_EXPORT geometry::Transform2D localTransform(const ItemShape& shape);

}  // namespace scene
}  // namespace lasercam

#endif  // LASERCAM_SCENE_ITEM_H
