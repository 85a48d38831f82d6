/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCENE_STATE_HPP
#define SCENE_STATE_HPP

#include "world/TreeParticle.hpp"

namespace TinselEngine {

/**
 * @brief The single assembled/dispersed flag of the tree scene
 *
 * Written only by TreeSceneState in response to input. Read once per fixed
 * step when the layout is handed to ParticleManager::update() by value.
 *
 * Not synchronized: input, update and render all run on the SDL main
 * thread (see GameLoop). Guard it before touching it from another thread.
 */
class SceneState {
public:
    explicit SceneState(TreeLayout initial = TreeLayout::Assembled) : m_layout(initial) {}

    void setLayout(TreeLayout layout) { m_layout = layout; }

    // Flip the layout and return the new one
    TreeLayout toggle() {
        m_layout = isAssembled() ? TreeLayout::Dispersed : TreeLayout::Assembled;
        return m_layout;
    }

    TreeLayout getLayout() const { return m_layout; }
    bool isAssembled() const { return m_layout == TreeLayout::Assembled; }

private:
    TreeLayout m_layout;
};

} // namespace TinselEngine

#endif // SCENE_STATE_HPP
