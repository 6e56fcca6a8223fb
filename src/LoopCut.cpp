#include <loom/LoopCut.hpp>
#include <loom/Log.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace loom {

std::vector<float> loopCutPositions(int segments, float slideT) {
    int n = std::max(kMinLoopCutSegments, segments);

    // The even spacing i/(n+1) averages to 0.5, so slideT - 0.5 shifts the whole set
    float shift = slideT - 0.5f;
    std::vector<float> positions;
    positions.reserve(n);
    for (int i = 1; i <= n; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(n + 1) + shift;
        positions.push_back(std::clamp(t, 0.001f, 0.999f));
    }
    return positions;
}

namespace {

bool isFaceSide(const Face& face, VertexId a, VertexId b) {
    for (const auto& [x, y] : faceBoundary(face)) {
        if ((x == a && y == b) || (x == b && y == a)) return true;
    }
    return false;
}

// Both parallels must be opposite sides of a quad, joined a0-b0 and a1-b1,
// and all four corners must exist
bool spanFits(const Face& face, const FaceSpan& span,
              const std::unordered_map<VertexId, size_t>& vertexIndex) {
    if (!face.isQuad()) return false;
    const auto& [a0, a1] = span.parallelA;
    const auto& [b0, b1] = span.parallelB;
    for (VertexId vid : {a0, a1, b0, b1}) {
        if (!vertexIndex.count(vid)) return false;
    }
    return isFaceSide(face, a0, a1) && isFaceSide(face, b0, b1)
        && isFaceSide(face, a0, b0) && isFaceSide(face, a1, b1);
}

class LoopCutBuilder {
public:
    LoopCutBuilder(Mesh& mesh, const std::vector<float>& positions)
        : m_mesh(mesh)
        , m_positions(positions)
        , m_vertexIndex(buildVertexIndex(mesh)) {
    }

    // Corners from `from` to `to` with the new cut vertices in between, plus
    // matching loop UVs when the face carries them
    void buildSide(const Face& face, VertexId from, VertexId to,
                   std::vector<VertexId>& ids, std::vector<glm::vec2>& uvs) {
        size_t n = m_positions.size();
        bool fromIsLow = canonicalEdgeOrder(m_mesh, from, to).first == from;

        bool loopUVs = face.hasLoopUVs();
        glm::vec2 uvFrom(0.0f), uvTo(0.0f);
        if (loopUVs) {
            for (size_t c = 0; c < face.vertexIds.size(); ++c) {
                if (face.vertexIds[c] == from) uvFrom = face.uvs[c];
                if (face.vertexIds[c] == to) uvTo = face.uvs[c];
            }
        }
        glm::vec2 uvLow = fromIsLow ? uvFrom : uvTo;
        glm::vec2 uvHigh = fromIsLow ? uvTo : uvFrom;

        ids.push_back(from);
        if (loopUVs) uvs.push_back(uvFrom);
        for (size_t i = 0; i < n; ++i) {
            size_t segment = fromIsLow ? i : n - 1 - i;
            float t = m_positions[segment];
            ids.push_back(splitEdge(from, to, segment, t));
            if (loopUVs) uvs.push_back(glm::mix(uvLow, uvHigh, t));
        }
        ids.push_back(to);
        if (loopUVs) uvs.push_back(uvTo);
    }

    size_t getCreatedCount() const { return m_splits.size(); }

private:
    VertexId splitEdge(VertexId a, VertexId b, size_t segment, float t) {
        auto key = std::make_pair(makeEdgeKey(a, b), segment);
        auto found = m_splits.find(key);
        if (found != m_splits.end()) return found->second;

        VertexPair ordered = canonicalEdgeOrder(m_mesh, a, b);
        // Copies: createVertex may reallocate the vertex array
        Vertex low = m_mesh.vertices[m_vertexIndex.at(ordered.first)];
        Vertex high = m_mesh.vertices[m_vertexIndex.at(ordered.second)];

        VertexId vid = m_mesh.createVertex(glm::mix(low.position, high.position, t),
                                           glm::mix(low.normal, high.normal, t),
                                           glm::mix(low.uv, high.uv, t));
        Vertex& created = m_mesh.vertices.back();
        if (low.uv2 && high.uv2) {
            created.uv2 = glm::mix(*low.uv2, *high.uv2, t);
        }

        m_vertexIndex[vid] = m_mesh.vertices.size() - 1;
        m_splits[key] = vid;
        return vid;
    }

    Mesh& m_mesh;
    const std::vector<float>& m_positions;
    std::unordered_map<VertexId, size_t> m_vertexIndex;
    std::map<std::pair<EdgeKey, size_t>, VertexId> m_splits;   // (edge, segment) -> new vertex
};

} // namespace

bool applyLoopCut(MeshStore& meshes, MeshId meshId, EdgeId edgeId, int segments, float slideT,
                  const std::vector<FaceSpan>& spans) {
    auto mesh = meshes.snapshot(meshId);
    if (!mesh) {
        logErr() << "[LoopCut] Unknown mesh " << meshId << std::endl;
        return false;
    }

    std::vector<FaceSpan> candidates = spans.empty() ? computeEdgeLoopFaceSpans(*mesh, edgeId) : spans;
    std::vector<FaceSpan> cut;
    auto faceIndex = buildFaceIndex(*mesh);
    auto vertexIndex = buildVertexIndex(*mesh);
    for (const auto& span : candidates) {
        auto it = faceIndex.find(span.faceId);
        if (it != faceIndex.end() && spanFits(mesh->faces[it->second], span, vertexIndex)) {
            cut.push_back(span);
        }
    }
    if (cut.empty()) {
        logErr() << "[LoopCut] No quad loop through edge " << edgeId << ", nothing cut" << std::endl;
        return false;
    }

    int n = std::clamp(segments, kMinLoopCutSegments, kMaxLoopCutSegments);
    std::vector<float> positions = loopCutPositions(n, slideT);
    size_t created = 0;

    bool applied = meshes.updateMesh(meshId, [&](Mesh& m) {
        LoopCutBuilder builder(m, positions);
        std::unordered_set<FaceId> replaced;
        std::vector<Face> newFaces;

        auto index = buildFaceIndex(m);
        for (const auto& span : cut) {
            // Copy: new faces are appended to m.faces only after the loop
            const Face source = m.faces[index.at(span.faceId)];
            const auto& [a0, a1] = span.parallelA;
            const auto& [b0, b1] = span.parallelB;

            std::vector<VertexId> sideA, sideB;
            std::vector<glm::vec2> uvA, uvB;
            builder.buildSide(source, a0, a1, sideA, uvA);
            builder.buildSide(source, b0, b1, sideB, uvB);

            // Keep the source winding: a0 -> a1 in the face means the strip runs A then B
            size_t c = std::find(source.vertexIds.begin(), source.vertexIds.end(), a0) - source.vertexIds.begin();
            bool forward = source.vertexIds[(c + 1) % 4] == a1;

            for (size_t k = 0; k + 1 < sideA.size(); ++k) {
                Face f;
                f.id = m.nextFaceId++;
                f.materialId = source.materialId;
                if (forward) {
                    f.vertexIds = {sideA[k], sideA[k + 1], sideB[k + 1], sideB[k]};
                    if (source.hasLoopUVs()) f.uvs = {uvA[k], uvA[k + 1], uvB[k + 1], uvB[k]};
                } else {
                    f.vertexIds = {sideB[k], sideB[k + 1], sideA[k + 1], sideA[k]};
                    if (source.hasLoopUVs()) f.uvs = {uvB[k], uvB[k + 1], uvA[k + 1], uvA[k]};
                }
                newFaces.push_back(std::move(f));
            }
            replaced.insert(source.id);
        }

        m.faces.erase(std::remove_if(m.faces.begin(), m.faces.end(),
                                     [&](const Face& f) { return replaced.count(f.id) > 0; }),
                      m.faces.end());
        for (auto& f : newFaces) m.faces.push_back(std::move(f));
        created = builder.getCreatedCount();
    }, MeshChange::Topology);

    if (applied) {
        logOut() << "[LoopCut] Cut " << cut.size() << " faces with " << n << " segment(s), "
                 << created << " new vertices" << std::endl;
    }
    return applied;
}

// ---------------------------------------------------------------------------
// LoopCutTool
// ---------------------------------------------------------------------------

LoopCutTool::LoopCutTool(ToolStore& tools, MeshStore& meshes, const EditorSettings& settings)
    : m_tools(tools)
    , m_meshes(meshes)
    , m_settings(settings) {
}

bool LoopCutTool::isActive() const {
    return m_tools.isActive() && m_tools.getTool() == ToolKind::LoopCut;
}

const LoopCutData* LoopCutTool::getData() const {
    if (!isActive()) return nullptr;
    return std::get_if<LoopCutData>(&m_tools.getLocalData());
}

LoopCutData* LoopCutTool::data() {
    if (!isActive()) return nullptr;
    return std::get_if<LoopCutData>(&m_tools.getLocalData());
}

bool LoopCutTool::begin(MeshId meshId, const Transform& objectTransform) {
    if (!m_meshes.contains(meshId)) {
        logErr() << "[LoopCut] Unknown mesh " << meshId << std::endl;
        return false;
    }

    LoopCutData d;
    d.meshId = meshId;
    d.objectTransform = objectTransform;
    d.segments = std::clamp(m_settings.loopCutSegments, kMinLoopCutSegments, kMaxLoopCutSegments);
    if (!m_tools.startOperation(ToolKind::LoopCut, std::move(d))) return false;

    logOut() << "[LoopCut] Choose an edge on mesh " << meshId << std::endl;
    return true;
}

bool LoopCutTool::hover(const Ray& ray, const Transform& objectTransform) {
    LoopCutData* d = data();
    if (!d || d->phase != LoopCutPhase::Choose) return false;

    d->objectTransform = objectTransform;
    auto mesh = m_meshes.snapshot(d->meshId);
    MeshRayHit hit;
    if (mesh) hit = raycastFaces(*mesh, objectTransform, ray);

    EdgeId edgeId = hit.hit ? closestFaceEdge(*mesh, objectTransform, hit.faceId, hit.position) : kInvalidId;
    if (edgeId == kInvalidId) {
        d->edgeId = kInvalidId;
        d->spans.clear();
        d->previewLines.clear();
        return false;
    }
    return hoverEdge(edgeId);
}

bool LoopCutTool::hoverEdge(EdgeId edgeId) {
    LoopCutData* d = data();
    if (!d || d->phase != LoopCutPhase::Choose) return false;

    auto mesh = m_meshes.snapshot(d->meshId);
    if (!mesh || !mesh->findEdge(edgeId)) {
        d->edgeId = kInvalidId;
        d->spans.clear();
        d->previewLines.clear();
        return false;
    }

    d->edgeId = edgeId;
    d->spans = computeEdgeLoopFaceSpans(*mesh, edgeId);
    refreshPreview(*d);
    return !d->spans.empty();
}

void LoopCutTool::adjustSegments(int delta) {
    LoopCutData* d = data();
    if (!d) return;
    setSegments(d->segments + delta);
}

void LoopCutTool::setSegments(int segments) {
    LoopCutData* d = data();
    if (!d) return;
    d->segments = std::clamp(segments, kMinLoopCutSegments, kMaxLoopCutSegments);
    refreshPreview(*d);
}

bool LoopCutTool::confirm(const ViewContext& view) {
    LoopCutData* d = data();
    if (!d) return false;

    if (d->phase == LoopCutPhase::Slide) return commit();

    if (d->edgeId == kInvalidId || d->spans.empty()) {
        logErr() << "[LoopCut] No loop under the cursor" << std::endl;
        return false;
    }

    d->phase = LoopCutPhase::Slide;
    d->slideT = 0.5f;
    d->slideAxis = glm::vec2(1.0f, 0.0f);

    // Screen direction from the first span's entry edge to its opposite edge
    auto mesh = m_meshes.snapshot(d->meshId);
    if (mesh) {
        const FaceSpan& first = d->spans.front();
        glm::vec3 a = d->objectTransform.localToWorld(evalEdgePoint(*mesh, first.parallelA, 0.5f));
        glm::vec3 b = d->objectTransform.localToWorld(evalEdgePoint(*mesh, first.parallelB, 0.5f));
        glm::vec3 dir = b - a;
        glm::vec2 screen(glm::dot(dir, view.cameraRight), -glm::dot(dir, view.cameraUp));
        if (glm::dot(screen, screen) > 1e-12f) d->slideAxis = glm::normalize(screen);
    }

    refreshPreview(*d);
    logOut() << "[LoopCut] Sliding " << d->spans.size() << " faces from edge " << d->edgeId << std::endl;
    return true;
}

void LoopCutTool::slide(float movementX, float movementY) {
    LoopCutData* d = data();
    if (!d || d->phase != LoopCutPhase::Slide) return;

    float along = movementX * d->slideAxis.x + movementY * d->slideAxis.y;
    float reference = std::max(300.0f, m_settings.slideReferenceLength);
    setSlide(d->slideT + along / reference);
}

void LoopCutTool::setSlide(float slideT) {
    LoopCutData* d = data();
    if (!d || d->phase != LoopCutPhase::Slide) return;
    d->slideT = std::clamp(slideT, 0.0f, 1.0f);
    refreshPreview(*d);
}

bool LoopCutTool::commit() {
    LoopCutData* d = data();
    if (!d) return false;

    if (d->phase != LoopCutPhase::Slide || d->edgeId == kInvalidId) {
        logErr() << "[LoopCut] Nothing locked to commit" << std::endl;
        return false;
    }

    LoopCutData locked = *d;
    m_tools.endOperation();
    return applyLoopCut(m_meshes, locked.meshId, locked.edgeId, locked.segments, locked.slideT, locked.spans);
}

void LoopCutTool::cancel() {
    if (!isActive()) return;
    m_tools.endOperation();
    logOut() << "[LoopCut] Cancelled" << std::endl;
}

void LoopCutTool::refreshPreview(LoopCutData& d) const {
    d.previewLines.clear();
    auto mesh = m_meshes.snapshot(d.meshId);
    if (!mesh || d.spans.empty()) return;

    std::vector<float> positions;
    if (d.phase == LoopCutPhase::Slide) {
        positions = loopCutPositions(d.segments, d.slideT);
    } else {
        for (int i = 1; i <= d.segments; ++i) {
            positions.push_back(static_cast<float>(i) / static_cast<float>(d.segments + 1));
        }
    }

    for (const auto& span : d.spans) {
        for (float t : positions) {
            glm::vec3 a = canonicalEdgePoint(*mesh, span.parallelA.first, span.parallelA.second, t);
            glm::vec3 b = canonicalEdgePoint(*mesh, span.parallelB.first, span.parallelB.second, t);
            d.previewLines.emplace_back(d.objectTransform.localToWorld(a), d.objectTransform.localToWorld(b));
        }
    }
}

} // namespace loom
