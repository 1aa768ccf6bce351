// =====================================================================
//  src/liblasercam/lasercam/scene/scene.h — Scene model
// =====================================================================
//
//  An ordered list of layers and items.  A Scene is a value: every
//  edit returns a new scene with an incremented version and leaves the
//  original untouched, so a caller can keep old scenes as snapshots and
//  an emitter can read one while the editor produces the next.
//
//  Identities come from per-scene counters ("item_<n>", "layer_<n>"),
//  so replaying the same edits yields equal scenes.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_SCENE_SCENE_H
#define LASERCAM_SCENE_SCENE_H

#include "layer.h"

namespace lasercam {
namespace scene {

struct SceneEdit;

/// Direction for reordering layers
enum class LayerMove {
    Up,
    Down
};

class LASERCAM_EXPORT Scene {
public:
    Scene() = default;

    // ---- Queries ----

    int version() const { return m_version; }
    const QVector<Layer>& layers() const { return m_layers; }
    const QVector<CanvasItem>& items() const { return m_items; }

    /// Layer by id, or nullptr
    const Layer* layer(const QString& id) const;

    /// Item by id, or nullptr
    const CanvasItem* item(const QString& id) const;

    /// First layer with a printing method, or nullptr
    const Layer* firstLayerFor(PrintingMethod method) const;

    /// Items on one layer, in scene order
    QVector<CanvasItem> itemsOnLayer(const QString& layerId) const;

    // ---- Items ----

    /// Add an item, routing it to a layer of its printing method
    ///
    /// With an explicit `layerId` the layer must exist and match the
    /// item's printing method.  Without one, the first matching layer is
    /// used and created on demand.
    SceneEdit addItem(const ItemShape& shape,
                      const std::optional<QString>& layerId = std::nullopt) const;

    /// Convert imported records into drawings (groups into GroupObjects)
    /// and add them, each record becoming one item.
    SceneEdit addShapes(const QVector<importer::ShapeRecord>& shapes,
                        const QPointF& offset = QPointF(0, 0)) const;

    /// Replace an item's payload; its printing method may not change
    SceneEdit updateItem(const QString& id, const ItemShape& shape) const;

    SceneEdit removeItem(const QString& id) const;

    /// Move an item to another layer with the same printing method
    SceneEdit moveItemToLayer(const QString& id, const QString& layerId) const;

    /// Replace several items with new ones on the same layer, in place
    /// of the first replaced item.  Used by the eraser.
    SceneEdit replaceItems(const QStringList& removedIds,
                           const QVector<ItemShape>& added,
                           const QString& layerId) const;

    // ---- Layers ----

    SceneEdit addLayer(const QString& name, PrintingMethod method) const;

    /// Update name, visibility and raster parameters of a layer
    /// The printing method of an existing layer is never changed.
    SceneEdit updateLayer(const Layer& layer) const;

    /// Remove a SCAN layer and every item on it
    /// ENGRAVE layers cannot be removed.
    SceneEdit removeLayer(const QString& id) const;

    SceneEdit moveLayer(const QString& id, LayerMove direction) const;

private:
    QString nextItemId();
    QString nextLayerId();
    QString ensureLayer(PrintingMethod method);
    CanvasItem makeItem(const ItemShape& shape, const QString& layerId);
    SceneEdit commit() const;

    QVector<Layer> m_layers;
    QVector<CanvasItem> m_items;
    int m_version = 0;
    int m_itemCounter = 0;
    int m_layerCounter = 0;
};

/// Result of a scene edit
struct LASERCAM_EXPORT SceneEdit {
    bool success = false;
    QString errorMessage;
    Scene scene;                 ///< New scene on success, the unchanged input otherwise
    QStringList createdIds;      ///< Ids of items or layers the edit created
};

/// Item payload for one imported record
LASERCAM_EXPORT ItemShape shapeFromRecord(const importer::ShapeRecord& record);

}  // namespace scene
}  // namespace lasercam

#endif  // LASERCAM_SCENE_SCENE_H
