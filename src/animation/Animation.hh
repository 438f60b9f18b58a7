// SPDX-License-Identifier: MIT
#pragma once
#include <vector>

#include "KeyFrame.hh"

class AbstractAnimation {
public:
    int lastKeyFrameIdx = -1;
};

template<typename Frame_T>
class Animation : public AbstractAnimation
{
public:
    std::vector<Frame_T> keyFrames;
    void insertKeyFrame(Frame_T frame) {
        this->keyFrames.emplace_back(frame);
        this->lastKeyFrameIdx++;
    }

    void insertKeyFrames(const std::vector<Frame_T>& frames) {
        for(auto frame : frames) {
            insertKeyFrame(frame);
        }
    }

    float duration() const {
        return keyFrames.empty() ? 0.f : keyFrames.back().mTime;
    }
};
