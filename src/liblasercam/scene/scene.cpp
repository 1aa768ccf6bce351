// =====================================================================
//  src/liblasercam/scene/scene.cpp — Scene model
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/scene/scene.h>
#include <lasercam/log.h>

#include <algorithm>

namespace lasercam {
namespace scene {

namespace {

SceneEdit refuse(const Scene& scene, const QString& message)
{
    qCWarning(lcScene) << "Scene edit refused:" << message;
    SceneEdit edit;
    edit.success = false;
    edit.errorMessage = message;
    edit.scene = scene;
    return edit;
}

/// Child payload for a polyline inside an imported group
Drawing drawingFromPolyline(const importer::Polyline& poly)
{
    Drawing drawing;
    drawing.points = poly.points;
    drawing.x = poly.origin.x();
    drawing.y = poly.origin.y();
    drawing.color = poly.strokeColor;
    drawing.strokeWidth = poly.strokeWidth;
    drawing.fillColor = poly.fillColor;
    return drawing;
}

}  // anonymous namespace

// =====================================================================
//  Layer
// =====================================================================

Layer Layer::defaultScanLayer(const QString& id)
{
    Layer layer;
    layer.id = id;
    layer.name = QStringLiteral("Scan layer");
    layer.printingMethod = PrintingMethod::Scan;
    // Raster parameters stay unset so the machine profile applies
    return layer;
}

Layer Layer::defaultEngraveLayer(const QString& id)
{
    Layer layer;
    layer.id = id;
    layer.name = QStringLiteral("Cut layer");
    layer.printingMethod = PrintingMethod::Engrave;
    return layer;
}

// =====================================================================
//  Record conversion
// =====================================================================

ItemShape shapeFromRecord(const importer::ShapeRecord& record)
{
    if (const auto* poly = std::get_if<importer::Polyline>(&record)) {
        return drawingFromPolyline(*poly);
    }

    const importer::Group& group = std::get<importer::Group>(record);
    GroupObject object;
    object.x = group.originX;
    object.y = group.originY;
    object.width = group.width;
    object.height = group.height;
    object.rotation = group.rotation;
    object.children.reserve(group.children.size());
    for (const importer::ShapeRecord& child : group.children) {
        CanvasItem item;
        item.shape = shapeFromRecord(child);
        object.children.push_back(item);
    }
    return object;
}

// =====================================================================
//  Queries
// =====================================================================

const Layer* Scene::layer(const QString& id) const
{
    for (const Layer& l : m_layers) {
        if (l.id == id) return &l;
    }
    return nullptr;
}

const CanvasItem* Scene::item(const QString& id) const
{
    for (const CanvasItem& i : m_items) {
        if (i.id == id) return &i;
    }
    return nullptr;
}

const Layer* Scene::firstLayerFor(PrintingMethod method) const
{
    for (const Layer& l : m_layers) {
        if (l.printingMethod == method) return &l;
    }
    return nullptr;
}

QVector<CanvasItem> Scene::itemsOnLayer(const QString& layerId) const
{
    QVector<CanvasItem> result;
    for (const CanvasItem& i : m_items) {
        if (i.layerId == layerId) result.append(i);
    }
    return result;
}

// =====================================================================
//  Internal helpers (operate on a private copy)
// =====================================================================

QString Scene::nextItemId()
{
    return QStringLiteral("item_%1").arg(++m_itemCounter);
}

QString Scene::nextLayerId()
{
    return QStringLiteral("layer_%1").arg(++m_layerCounter);
}

QString Scene::ensureLayer(PrintingMethod method)
{
    if (const Layer* existing = firstLayerFor(method)) {
        return existing->id;
    }

    QString id = nextLayerId();
    Layer created = method == PrintingMethod::Scan ? Layer::defaultScanLayer(id)
                                                   : Layer::defaultEngraveLayer(id);
    m_layers.append(created);
    qCDebug(lcScene) << "Created" << created.name << id;
    return id;
}

CanvasItem Scene::makeItem(const ItemShape& shape, const QString& layerId)
{
    CanvasItem result;
    result.id = nextItemId();
    result.layerId = layerId;
    result.shape = shape;

    // Children of groups get identities too
    if (auto* group = std::get_if<GroupObject>(&result.shape)) {
        for (CanvasItem& child : group->children) {
            child = makeItem(child.shape, layerId);
        }
    }
    return result;
}

SceneEdit Scene::commit() const
{
    SceneEdit edit;
    edit.success = true;
    edit.scene = *this;
    ++edit.scene.m_version;
    return edit;
}

// =====================================================================
//  Items
// =====================================================================

SceneEdit Scene::addItem(const ItemShape& shape, const std::optional<QString>& layerId) const
{
    PrintingMethod method = printingMethodFor(shape);
    Scene next = *this;

    QString target;
    if (layerId) {
        const Layer* l = layer(*layerId);
        if (!l) {
            return refuse(*this, QStringLiteral("No layer %1").arg(*layerId));
        }
        if (l->printingMethod != method) {
            return refuse(*this, QStringLiteral("%1 items cannot be placed on %2 layer %3")
                                     .arg(itemKindName(shape), printingMethodName(l->printingMethod),
                                          *layerId));
        }
        target = *layerId;
    } else {
        target = next.ensureLayer(method);
    }

    CanvasItem created = next.makeItem(shape, target);
    next.m_items.append(created);

    SceneEdit edit = next.commit();
    edit.createdIds.append(created.id);
    return edit;
}

SceneEdit Scene::addShapes(const QVector<importer::ShapeRecord>& shapes, const QPointF& offset) const
{
    if (shapes.isEmpty()) {
        return refuse(*this, QStringLiteral("Nothing to add"));
    }

    Scene next = *this;
    QStringList created;
    for (const importer::ShapeRecord& record : shapes) {
        ItemShape shape = shapeFromRecord(record);
        if (!offset.isNull()) {
            CanvasItem probe;
            probe.shape = shape;
            shape = withPosition(shape, probe.position() + offset);
        }

        QString target = next.ensureLayer(printingMethodFor(shape));
        CanvasItem item = next.makeItem(shape, target);
        next.m_items.append(item);
        created.append(item.id);
    }

    SceneEdit edit = next.commit();
    edit.createdIds = created;
    return edit;
}

SceneEdit Scene::updateItem(const QString& id, const ItemShape& shape) const
{
    const CanvasItem* existing = item(id);
    if (!existing) {
        return refuse(*this, QStringLiteral("No item %1").arg(id));
    }
    if (printingMethodFor(existing->shape) != printingMethodFor(shape)) {
        return refuse(*this, QStringLiteral("Item %1 cannot change its printing method").arg(id));
    }

    Scene next = *this;
    for (CanvasItem& i : next.m_items) {
        if (i.id != id) continue;
        i.shape = shape;
        if (auto* group = std::get_if<GroupObject>(&i.shape)) {
            for (CanvasItem& child : group->children) {
                if (child.id.isEmpty()) child = next.makeItem(child.shape, i.layerId);
            }
        }
        break;
    }
    return next.commit();
}

SceneEdit Scene::removeItem(const QString& id) const
{
    if (!item(id)) {
        return refuse(*this, QStringLiteral("No item %1").arg(id));
    }

    Scene next = *this;
    next.m_items.erase(std::remove_if(next.m_items.begin(), next.m_items.end(),
                                      [&id](const CanvasItem& i) { return i.id == id; }),
                       next.m_items.end());
    return next.commit();
}

SceneEdit Scene::moveItemToLayer(const QString& id, const QString& layerId) const
{
    const CanvasItem* existing = item(id);
    if (!existing) {
        return refuse(*this, QStringLiteral("No item %1").arg(id));
    }
    const Layer* target = layer(layerId);
    if (!target) {
        return refuse(*this, QStringLiteral("No layer %1").arg(layerId));
    }
    if (target->printingMethod != printingMethodFor(existing->shape)) {
        return refuse(*this, QStringLiteral("%1 items cannot be moved to %2 layer %3")
                                 .arg(itemKindName(existing->shape),
                                      printingMethodName(target->printingMethod), layerId));
    }

    Scene next = *this;
    for (CanvasItem& i : next.m_items) {
        if (i.id == id) {
            i.layerId = layerId;
            break;
        }
    }
    return next.commit();
}

SceneEdit Scene::replaceItems(const QStringList& removedIds,
                              const QVector<ItemShape>& added,
                              const QString& layerId) const
{
    const Layer* target = layer(layerId);
    if (!target) {
        return refuse(*this, QStringLiteral("No layer %1").arg(layerId));
    }
    for (const ItemShape& shape : added) {
        if (printingMethodFor(shape) != target->printingMethod) {
            return refuse(*this, QStringLiteral("%1 items cannot be placed on layer %2")
                                     .arg(itemKindName(shape), layerId));
        }
    }

    Scene next = *this;
    int insertAt = -1;
    for (int i = next.m_items.size() - 1; i >= 0; --i) {
        if (removedIds.contains(next.m_items[i].id)) {
            next.m_items.removeAt(i);
            insertAt = i;
        }
    }
    if (insertAt < 0) {
        insertAt = next.m_items.size();
    }

    QStringList created;
    for (const ItemShape& shape : added) {
        CanvasItem item = next.makeItem(shape, layerId);
        next.m_items.insert(insertAt++, item);
        created.append(item.id);
    }

    SceneEdit edit = next.commit();
    edit.createdIds = created;
    return edit;
}

// =====================================================================
//  Layers
// =====================================================================

SceneEdit Scene::addLayer(const QString& name, PrintingMethod method) const
{
    Scene next = *this;
    QString id = next.nextLayerId();
    Layer created = method == PrintingMethod::Scan ? Layer::defaultScanLayer(id)
                                                   : Layer::defaultEngraveLayer(id);
    if (!name.isEmpty()) {
        created.name = name;
    }
    next.m_layers.append(created);

    SceneEdit edit = next.commit();
    edit.createdIds.append(id);
    return edit;
}

SceneEdit Scene::updateLayer(const Layer& updated) const
{
    if (!layer(updated.id)) {
        return refuse(*this, QStringLiteral("No layer %1").arg(updated.id));
    }

    Scene next = *this;
    for (Layer& l : next.m_layers) {
        if (l.id != updated.id) continue;
        PrintingMethod method = l.printingMethod;
        l = updated;
        l.printingMethod = method;
        break;
    }
    return next.commit();
}

SceneEdit Scene::removeLayer(const QString& id) const
{
    const Layer* existing = layer(id);
    if (!existing) {
        return refuse(*this, QStringLiteral("No layer %1").arg(id));
    }
    if (existing->printingMethod == PrintingMethod::Engrave) {
        return refuse(*this, QStringLiteral("Engrave layer %1 cannot be removed").arg(id));
    }

    Scene next = *this;
    next.m_layers.erase(std::remove_if(next.m_layers.begin(), next.m_layers.end(),
                                       [&id](const Layer& l) { return l.id == id; }),
                        next.m_layers.end());
    int before = next.m_items.size();
    next.m_items.erase(std::remove_if(next.m_items.begin(), next.m_items.end(),
                                      [&id](const CanvasItem& i) { return i.layerId == id; }),
                       next.m_items.end());

    qCDebug(lcScene) << "Removed layer" << id << "and" << (before - next.m_items.size()) << "items";
    return next.commit();
}

SceneEdit Scene::moveLayer(const QString& id, LayerMove direction) const
{
    int index = -1;
    for (int i = 0; i < m_layers.size(); ++i) {
        if (m_layers[i].id == id) {
            index = i;
            break;
        }
    }
    if (index < 0) {
        return refuse(*this, QStringLiteral("No layer %1").arg(id));
    }

    int target = direction == LayerMove::Up ? index - 1 : index + 1;
    if (target < 0 || target >= m_layers.size()) {
        return refuse(*this, QStringLiteral("Layer %1 cannot move further").arg(id));
    }

    Scene next = *this;
    next.m_layers.swapItemsAt(index, target);
    return next.commit();
}

}  // namespace scene
}  // namespace lasercam
