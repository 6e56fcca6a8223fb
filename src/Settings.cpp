#include <loom/Settings.hpp>
#include <loom/Log.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace loom {

std::string SettingsSerializer::s_lastError;

namespace {

json settingsToJson(const EditorSettings& s) {
    json root;
    root["version"] = 1;

    root["transform"]["moveSensitivity"] = s.moveSensitivity;
    root["transform"]["rotateSensitivity"] = s.rotateSensitivity;
    root["transform"]["scaleSensitivity"] = s.scaleSensitivity;
    root["transform"]["localSpaceEdits"] = s.localSpaceEdits;

    root["snapping"]["enabled"] = s.gridSnapping;
    root["snapping"]["gridSize"] = s.gridSize;
    root["snapping"]["uvGridSize"] = s.uvGridSize;

    root["loopCut"]["segments"] = s.loopCutSegments;
    root["loopCut"]["slideReferenceLength"] = s.slideReferenceLength;
    return root;
}

EditorSettings settingsFromJson(const json& root) {
    EditorSettings s;

    if (root.contains("transform")) {
        const auto& t = root["transform"];
        s.moveSensitivity = t.value("moveSensitivity", s.moveSensitivity);
        s.rotateSensitivity = t.value("rotateSensitivity", s.rotateSensitivity);
        s.scaleSensitivity = t.value("scaleSensitivity", s.scaleSensitivity);
        s.localSpaceEdits = t.value("localSpaceEdits", s.localSpaceEdits);
    }

    if (root.contains("snapping")) {
        const auto& snap = root["snapping"];
        s.gridSnapping = snap.value("enabled", s.gridSnapping);
        s.gridSize = snap.value("gridSize", s.gridSize);
        s.uvGridSize = snap.value("uvGridSize", s.uvGridSize);
    }

    if (root.contains("loopCut")) {
        const auto& lc = root["loopCut"];
        s.loopCutSegments = lc.value("segments", s.loopCutSegments);
        s.slideReferenceLength = lc.value("slideReferenceLength", s.slideReferenceLength);
    }

    // Out-of-range values are clamped rather than rejected
    s.loopCutSegments = std::clamp(s.loopCutSegments, 1, 64);
    s.slideReferenceLength = std::max(300.0f, s.slideReferenceLength);
    if (s.gridSize <= 0.0f) s.gridSize = EditorSettings().gridSize;
    if (s.uvGridSize <= 0.0f) s.uvGridSize = EditorSettings().uvGridSize;
    return s;
}

} // namespace

bool SettingsSerializer::fromJsonString(const std::string& text, EditorSettings& out) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            s_lastError = "Settings root is not an object";
            logErr() << "[Settings] " << s_lastError << std::endl;
            return false;
        }
        out = settingsFromJson(root);
        return true;
    } catch (const json::exception& e) {
        s_lastError = std::string("Parse failed: ") + e.what();
        logErr() << "[Settings] " << s_lastError << std::endl;
        return false;
    }
}

std::string SettingsSerializer::toJsonString(const EditorSettings& settings) {
    return settingsToJson(settings).dump(2);
}

bool SettingsSerializer::load(const std::string& filepath, EditorSettings& out) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        s_lastError = "Failed to open file: " + filepath;
        logErr() << "[Settings] " << s_lastError << std::endl;
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!fromJsonString(text, out)) return false;

    logOut() << "[Settings] Loaded " << filepath << std::endl;
    return true;
}

bool SettingsSerializer::save(const std::string& filepath, const EditorSettings& settings) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        s_lastError = "Failed to open file for writing: " + filepath;
        logErr() << "[Settings] " << s_lastError << std::endl;
        return false;
    }

    file << toJsonString(settings);
    if (!file.good()) {
        s_lastError = "Write failed: " + filepath;
        logErr() << "[Settings] " << s_lastError << std::endl;
        return false;
    }

    logOut() << "[Settings] Saved " << filepath << std::endl;
    return true;
}

} // namespace loom
