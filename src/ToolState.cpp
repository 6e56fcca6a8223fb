#include <loom/ToolState.hpp>
#include <loom/Log.hpp>

namespace loom {

namespace {

struct PreviewSizeVisitor {
    size_t operator()(const std::monostate&) const { return 0; }
    size_t operator()(const ObjectTransformData& d) const { return d.transforms.size(); }
    size_t operator()(const VertexTransformData& d) const { return d.positions.size(); }
    size_t operator()(const UVTransformData& d) const { return d.uvs.size() + d.loops.size(); }
    size_t operator()(const FaceExtrudeData& d) const { return d.positions.size(); }
    size_t operator()(const LoopCutData& d) const { return d.previewLines.size(); }
};

} // namespace

bool ToolStore::startOperation(ToolKind kind, ToolLocalData data) {
    if (m_active) {
        logErr() << "[Tool] " << getToolKindName(kind) << " refused, "
                 << getToolKindName(m_tool) << " is active" << std::endl;
        return false;
    }
    if (kind == ToolKind::None) return false;

    m_tool = kind;
    m_active = true;
    m_axisLock = AxisLock::None;
    m_localData = std::move(data);
    return true;
}

void ToolStore::endOperation() {
    m_tool = ToolKind::None;
    m_active = false;
    m_axisLock = AxisLock::None;
    m_localData = std::monostate{};
}

void ToolStore::reset() {
    endOperation();
}

void ToolStore::toggleAxisLock(AxisLock axis) {
    m_axisLock = (m_axisLock == axis) ? AxisLock::None : axis;
}

size_t ToolStore::getPreviewSize() const {
    return std::visit(PreviewSizeVisitor{}, m_localData);
}

} // namespace loom
