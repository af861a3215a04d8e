#ifndef LOFT_HPP
#define LOFT_HPP

#include "../math/math.hpp"
#include "types.hpp"
#include "PathParser.hpp"
#include "PathLibrary.hpp"
#include "SilhouetteSampler.hpp"
#include "OutlineNormalizer.hpp"
#include "Lofter.hpp"
#include "Skeleton.hpp"
#include "SkinWeights.hpp"
#include "MeshMerger.hpp"
#include "VertexColorizer.hpp"
#include "Material.hpp"
#include "Primitives.hpp"
#include "AnimationClip.hpp"
#include "LoftConfig.hpp"
#include "AssetExporter.hpp"
#include "MeshFile.hpp"
#include "LoftPipeline.hpp"
#include "BowlingPin.hpp"

#endif // LOFT_HPP
