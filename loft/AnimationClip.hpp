#pragma once
#include <string>
#include <vector>

enum TrackProperty {
    TRACK_POSITION,
    TRACK_QUATERNION,
    TRACK_SCALE
};

// Keyframes for one bone property; values hold 3 (position, scale) or 4
// (quaternion xyzw) floats per time
struct AnimationTrack {
    std::string bone;
    TrackProperty property;
    std::vector<float> times;
    std::vector<float> values;

    int components() const {
        return property == TRACK_QUATERNION ? 4 : 3;
    }
};

struct AnimationClip {
    std::string name;
    float duration;
    std::vector<AnimationTrack> tracks;
};
