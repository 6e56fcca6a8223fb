#pragma once

// LOOM mesh editing core - Main Include
// Include this single header to use the editing engine

#include "Log.hpp"
#include "Mesh.hpp"
#include "MeshStore.hpp"
#include "Topology.hpp"
#include "Primitives.hpp"
#include "Transform.hpp"
#include "Scene.hpp"
#include "Raycast.hpp"
#include "Input.hpp"
#include "Settings.hpp"
#include "ToolState.hpp"
#include "Selection.hpp"
#include "TransformOperation.hpp"
#include "LoopCut.hpp"
#include "Extrude.hpp"
#include "EditSession.hpp"
