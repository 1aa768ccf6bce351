// =====================================================================
//  src/liblasercam/scene/item.cpp — Canvas items
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/item.h>
#include <lasercam/geometry/utils.h>

namespace lasercam {
namespace scene {

// =====================================================================
//  Printing methods
// =====================================================================

QString printingMethodName(PrintingMethod method)
{
    switch (method) {
    case PrintingMethod::Scan:    return QStringLiteral("scan");
    case PrintingMethod::Engrave: return QStringLiteral("engrave");
    }
    return QString();
}

std::optional<PrintingMethod> printingMethodFromName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("scan")) return PrintingMethod::Scan;
    if (lower == QLatin1String("engrave")) return PrintingMethod::Engrave;
    return std::nullopt;
}

// =====================================================================
//  Part catalog
// =====================================================================

namespace {

struct PartCatalogEntry {
    PartType type;
    const char* name;
};

const PartCatalogEntry PART_CATALOG[] = {
    {PartType::Rectangle,              "RECTANGLE"},
    {PartType::Circle,                 "CIRCLE"},
    {PartType::Line,                   "LINE"},
    {PartType::Flange,                 "FLANGE"},
    {PartType::Torus,                  "TORUS"},
    {PartType::LBracket,               "L_BRACKET"},
    {PartType::UChannel,               "U_CHANNEL"},
    {PartType::RectangleWithHoles,     "RECTANGLE_WITH_HOLES"},
    {PartType::CircleWithHoles,        "CIRCLE_WITH_HOLES"},
    {PartType::EquilateralTriangle,    "EQUILATERAL_TRIANGLE"},
    {PartType::IsoscelesRightTriangle, "ISOSCELES_RIGHT_TRIANGLE"},
    {PartType::Sector,                 "SECTOR"},
    {PartType::Arc,                    "ARC"},
    {PartType::Polyline,               "POLYLINE"},
};

}  // anonymous namespace

QString partTypeName(PartType type)
{
    for (const PartCatalogEntry& entry : PART_CATALOG) {
        if (entry.type == type) return QString::fromLatin1(entry.name);
    }
    return QString();
}

std::optional<PartType> partTypeFromName(const QString& name)
{
    const QString upper = name.trimmed().toUpper();
    for (const PartCatalogEntry& entry : PART_CATALOG) {
        if (upper == QLatin1String(entry.name)) return entry.type;
    }
    return std::nullopt;
}

QVector<PartType> allPartTypes()
{
    QVector<PartType> types;
    for (const PartCatalogEntry& entry : PART_CATALOG) {
        types.append(entry.type);
    }
    return types;
}

PartParameters defaultParameters(PartType type)
{
    switch (type) {
    case PartType::Rectangle:
        return {{QStringLiteral("width"), 40}, {QStringLiteral("height"), 40}};
    case PartType::Circle:
        return {{QStringLiteral("radius"), 20}};
    case PartType::Line:
        return {{QStringLiteral("length"), 40}};
    case PartType::Flange:
        return {{QStringLiteral("outerDiameter"), 120},
                {QStringLiteral("innerDiameter"), 60},
                {QStringLiteral("boltCircleDiameter"), 90},
                {QStringLiteral("boltHoleCount"), 4},
                {QStringLiteral("boltHoleDiameter"), 8}};
    case PartType::Torus:
        return {{QStringLiteral("outerRadius"), 60}, {QStringLiteral("innerRadius"), 30}};
    case PartType::LBracket:
        return {{QStringLiteral("width"), 80}, {QStringLiteral("height"), 80},
                {QStringLiteral("thickness"), 15}};
    case PartType::UChannel:
        return {{QStringLiteral("width"), 80}, {QStringLiteral("height"), 100},
                {QStringLiteral("thickness"), 10}};
    case PartType::RectangleWithHoles:
        return {{QStringLiteral("width"), 120}, {QStringLiteral("height"), 80},
                {QStringLiteral("holeRadius"), 8},
                {QStringLiteral("horizontalMargin"), 20},
                {QStringLiteral("verticalMargin"), 20}};
    case PartType::CircleWithHoles:
        return {{QStringLiteral("radius"), 50}, {QStringLiteral("holeRadius"), 8},
                {QStringLiteral("holeCount"), 4}};
    case PartType::EquilateralTriangle:
        return {{QStringLiteral("sideLength"), 40}};
    case PartType::IsoscelesRightTriangle:
        return {{QStringLiteral("cathetus"), 50}};
    case PartType::Sector:
        return {{QStringLiteral("radius"), 50}, {QStringLiteral("startAngle"), -90},
                {QStringLiteral("sweepAngle"), 90}};
    case PartType::Arc:
        return {{QStringLiteral("radius"), 50}, {QStringLiteral("startAngle"), 0},
                {QStringLiteral("sweepAngle"), 120}};
    case PartType::Polyline:
        return {{QStringLiteral("seg1"), 40}, {QStringLiteral("seg2"), 50},
                {QStringLiteral("seg3"), 30}, {QStringLiteral("angle"), 135}};
    }
    return {};
}

double Part::parameter(const QString& name) const
{
    auto it = parameters.constFind(name);
    if (it != parameters.constEnd()) {
        return it.value();
    }
    return defaultParameters(type).value(name, 0.0);
}

// =====================================================================
//  Drawing
// =====================================================================

QVector<QPointF> Drawing::absolutePoints() const
{
    return geometry::placement(QPointF(x, y), rotation).apply(points);
}

// =====================================================================
//  CanvasItem
// =====================================================================

ItemKind itemKind(const ItemShape& shape)
{
    if (std::holds_alternative<Part>(shape)) return ItemKind::Part;
    if (std::holds_alternative<Drawing>(shape)) return ItemKind::Drawing;
    if (std::holds_alternative<TextObject>(shape)) return ItemKind::Text;
    if (std::holds_alternative<ImageObject>(shape)) return ItemKind::Image;
    return ItemKind::Group;
}

QString itemKindName(const ItemShape& shape)
{
    switch (itemKind(shape)) {
    case ItemKind::Part:    return partTypeName(std::get<Part>(shape).type);
    case ItemKind::Drawing: return QStringLiteral("DRAWING");
    case ItemKind::Text:    return QStringLiteral("TEXT");
    case ItemKind::Image:   return QStringLiteral("IMAGE");
    case ItemKind::Group:   return QStringLiteral("GROUP");
    }
    return QString();
}

PrintingMethod printingMethodFor(const ItemShape& shape)
{
    switch (itemKind(shape)) {
    case ItemKind::Image:
        return PrintingMethod::Scan;
    case ItemKind::Part:
    case ItemKind::Drawing:
    case ItemKind::Text:
    case ItemKind::Group:
        return PrintingMethod::Engrave;
    }
    return PrintingMethod::Engrave;
}

ItemShape withPosition(const ItemShape& shape, const QPointF& position)
{
    ItemShape moved = shape;
    std::visit([&position](auto& payload) {
        payload.x = position.x();
        payload.y = position.y();
    }, moved);
    return moved;
}

geometry::Transform2D localTransform(const ItemShape& shape)
{
    return std::visit([](const auto& payload) {
        return geometry::placement(QPointF(payload.x, payload.y), payload.rotation);
    }, shape);
}

ItemKind CanvasItem::kind() const
{
    return itemKind(shape);
}

QPointF CanvasItem::position() const
{
    return std::visit([](const auto& payload) {
        return QPointF(payload.x, payload.y);
    }, shape);
}

double CanvasItem::rotation() const
{
    return std::visit([](const auto& payload) { return payload.rotation; }, shape);
}

}  // namespace scene
}  // namespace lasercam
