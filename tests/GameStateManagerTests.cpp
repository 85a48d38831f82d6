/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GameStateManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/GameStateManager.hpp"
#include "gameStates/GameState.hpp"
#include <functional>
#include <memory>
#include <string>

// Mock GameState for testing
class MockGameState : public GameState {
public:
    explicit MockGameState(const std::string& name, bool enterResult = true)
        : m_name(name), m_enterResult(enterResult) {}

    bool enter() override {
        m_enterCalled = true;
        return m_enterResult;
    }

    void update(float deltaTime) override {
        m_updateCalled = true;
        m_lastDeltaTime = deltaTime;
    }

    void render(SDL_Renderer* /*renderer*/, float interpolationAlpha) override {
        m_renderCalled = true;
        m_lastAlpha = interpolationAlpha;
    }

    void handleInput() override {
        m_handleInputCalled = true;
        if (m_onInput) {
            m_onInput(mp_stateManager);
        }
    }

    bool exit() override {
        m_exitCalled = true;
        return true;
    }

    void pause() override { m_pauseCalled = true; }
    void resume() override { m_resumeCalled = true; }

    void onWindowResize(int logicalWidth, int logicalHeight) override {
        m_resizeWidth = logicalWidth;
        m_resizeHeight = logicalHeight;
    }

    std::string getName() const override { return m_name; }

    // Runs inside handleInput(), like a state reacting to a click
    void setInputAction(std::function<void(GameStateManager*)> action) { m_onInput = std::move(action); }

    bool wasEnterCalled() const { return m_enterCalled; }
    bool wasExitCalled() const { return m_exitCalled; }
    bool wasUpdateCalled() const { return m_updateCalled; }
    bool wasRenderCalled() const { return m_renderCalled; }
    bool wasHandleInputCalled() const { return m_handleInputCalled; }
    bool wasPauseCalled() const { return m_pauseCalled; }
    bool wasResumeCalled() const { return m_resumeCalled; }
    float getLastDeltaTime() const { return m_lastDeltaTime; }
    float getLastAlpha() const { return m_lastAlpha; }
    int getResizeWidth() const { return m_resizeWidth; }
    int getResizeHeight() const { return m_resizeHeight; }

    void resetFlags() {
        m_enterCalled = m_exitCalled = m_updateCalled = m_renderCalled =
        m_handleInputCalled = m_pauseCalled = m_resumeCalled = false;
    }

private:
    std::string m_name;
    bool m_enterResult;
    bool m_enterCalled{false};
    bool m_exitCalled{false};
    bool m_updateCalled{false};
    bool m_renderCalled{false};
    bool m_handleInputCalled{false};
    bool m_pauseCalled{false};
    bool m_resumeCalled{false};
    float m_lastDeltaTime{0.0f};
    float m_lastAlpha{0.0f};
    int m_resizeWidth{0};
    int m_resizeHeight{0};
    std::function<void(GameStateManager*)> m_onInput;
};

struct GameStateManagerFixture {
    GameStateManager manager;

    MockGameState* add(const std::string& name, bool enterResult = true) {
        auto state = std::make_unique<MockGameState>(name, enterResult);
        MockGameState* ptr = state.get();
        manager.addState(std::move(state));
        return ptr;
    }
};

BOOST_FIXTURE_TEST_SUITE(GameStateManagerTestSuite, GameStateManagerFixture)

BOOST_AUTO_TEST_CASE(TestInitialState) {
    BOOST_CHECK(!manager.hasState("nonexistent"));
    BOOST_CHECK(manager.getState("nonexistent") == nullptr);
    BOOST_CHECK(manager.getTopState() == nullptr);
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestAddState) {
    add("TestState");

    // Registered but not active
    BOOST_CHECK(manager.hasState("TestState"));
    BOOST_CHECK(!manager.isStateActive("TestState"));
    BOOST_CHECK_EQUAL(manager.getState("TestState")->getName(), "TestState");
}

BOOST_AUTO_TEST_CASE(TestAddDuplicateState) {
    add("TestState");
    BOOST_CHECK_THROW(add("TestState"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(TestPushState) {
    MockGameState* statePtr = add("TestState");

    manager.pushState("TestState");
    BOOST_CHECK(statePtr->wasEnterCalled());
    BOOST_CHECK(manager.isStateActive("TestState"));
    BOOST_CHECK_EQUAL(manager.getTopState()->getName(), "TestState");
}

BOOST_AUTO_TEST_CASE(TestPushNonexistentState) {
    BOOST_CHECK_NO_THROW(manager.pushState("NonexistentState"));
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestPushActiveStateTwiceIsIgnored) {
    add("TestState");
    manager.pushState("TestState");
    manager.pushState("TestState");
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestFailedEnterIsNotActivated) {
    MockGameState* base = add("Base");
    add("Broken", false);

    manager.pushState("Base");
    base->resetFlags();

    manager.pushState("Broken");

    BOOST_CHECK(!manager.isStateActive("Broken"));
    BOOST_CHECK_EQUAL(manager.getTopState()->getName(), "Base");
    // Base was paused for the attempt and resumed after it failed
    BOOST_CHECK(base->wasPauseCalled());
    BOOST_CHECK(base->wasResumeCalled());
}

BOOST_AUTO_TEST_CASE(TestPopState) {
    MockGameState* statePtr = add("TestState");
    manager.pushState("TestState");
    statePtr->resetFlags();

    manager.popState();
    BOOST_CHECK(statePtr->wasExitCalled());
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
    // Still registered for a later push
    BOOST_CHECK(manager.hasState("TestState"));
}

BOOST_AUTO_TEST_CASE(TestPopEmptyStack) {
    BOOST_CHECK_NO_THROW(manager.popState());
}

BOOST_AUTO_TEST_CASE(TestChangeState) {
    MockGameState* state1Ptr = add("State1");
    MockGameState* state2Ptr = add("State2");

    manager.pushState("State1");
    state1Ptr->resetFlags();

    manager.changeState("State2");

    BOOST_CHECK(state1Ptr->wasExitCalled());
    BOOST_CHECK(state2Ptr->wasEnterCalled());
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestUpdateReachesEveryActiveState) {
    MockGameState* scene = add("Scene");
    MockGameState* overlay = add("Overlay");

    manager.pushState("Scene");
    manager.pushState("Overlay");
    scene->resetFlags();
    overlay->resetFlags();

    const float deltaTime = 1.0f / 60.0f;
    manager.update(deltaTime);

    // The scene below an overlay keeps animating
    BOOST_CHECK(scene->wasUpdateCalled());
    BOOST_CHECK(overlay->wasUpdateCalled());
    BOOST_CHECK_EQUAL(scene->getLastDeltaTime(), deltaTime);
}

BOOST_AUTO_TEST_CASE(TestUpdateEmptyStack) {
    BOOST_CHECK_NO_THROW(manager.update(0.016f));
}

BOOST_AUTO_TEST_CASE(TestRenderDrawsWholeStack) {
    MockGameState* scene = add("Scene");
    MockGameState* overlay = add("Overlay");

    manager.pushState("Scene");
    manager.pushState("Overlay");

    manager.render(nullptr, 0.5f);

    BOOST_CHECK(scene->wasRenderCalled());
    BOOST_CHECK(overlay->wasRenderCalled());
    BOOST_CHECK_EQUAL(overlay->getLastAlpha(), 0.5f);
}

BOOST_AUTO_TEST_CASE(TestRenderEmptyStack) {
    BOOST_CHECK_NO_THROW(manager.render(nullptr));
}

BOOST_AUTO_TEST_CASE(TestHandleInputTopOnly) {
    MockGameState* state1Ptr = add("State1");
    MockGameState* state2Ptr = add("State2");

    manager.pushState("State1");
    manager.pushState("State2");

    manager.handleInput();

    BOOST_CHECK(!state1Ptr->wasHandleInputCalled());
    BOOST_CHECK(state2Ptr->wasHandleInputCalled());
}

BOOST_AUTO_TEST_CASE(TestHandleInputEmptyStack) {
    BOOST_CHECK_NO_THROW(manager.handleInput());
}

BOOST_AUTO_TEST_CASE(TestStateCanPushFromInput) {
    MockGameState* scene = add("Scene");
    MockGameState* overlay = add("Overlay");
    scene->setInputAction([](GameStateManager* mgr) { mgr->pushState("Overlay"); });

    manager.pushState("Scene");
    manager.handleInput();

    BOOST_CHECK(overlay->wasEnterCalled());
    BOOST_CHECK(scene->wasPauseCalled());
    BOOST_CHECK_EQUAL(manager.getTopState()->getName(), "Overlay");
}

BOOST_AUTO_TEST_CASE(TestStateCanPopItselfFromInput) {
    MockGameState* scene = add("Scene");
    MockGameState* overlay = add("Overlay");
    overlay->setInputAction([](GameStateManager* mgr) { mgr->popState(); });

    manager.pushState("Scene");
    manager.pushState("Overlay");
    scene->resetFlags();

    manager.handleInput();

    BOOST_CHECK(overlay->wasExitCalled());
    BOOST_CHECK(scene->wasResumeCalled());
    BOOST_CHECK_EQUAL(manager.getTopState()->getName(), "Scene");
}

BOOST_AUTO_TEST_CASE(TestPauseResume) {
    MockGameState* state1Ptr = add("State1");
    MockGameState* state2Ptr = add("State2");

    manager.pushState("State1");
    state1Ptr->resetFlags();

    manager.pushState("State2");
    BOOST_CHECK(state1Ptr->wasPauseCalled());
    BOOST_CHECK(state2Ptr->wasEnterCalled());

    state1Ptr->resetFlags();
    state2Ptr->resetFlags();

    manager.popState();
    BOOST_CHECK(state2Ptr->wasExitCalled());
    BOOST_CHECK(state1Ptr->wasResumeCalled());
}

BOOST_AUTO_TEST_CASE(TestNotifyResize) {
    MockGameState* scene = add("Scene");
    MockGameState* overlay = add("Overlay");
    MockGameState* idle = add("Idle");

    manager.pushState("Scene");
    manager.pushState("Overlay");

    manager.notifyResize(1920, 1080);

    BOOST_CHECK_EQUAL(scene->getResizeWidth(), 1920);
    BOOST_CHECK_EQUAL(overlay->getResizeHeight(), 1080);
    // Inactive states aren't told
    BOOST_CHECK_EQUAL(idle->getResizeWidth(), 0);
}

BOOST_AUTO_TEST_CASE(TestRemoveState) {
    add("State1");
    add("State2");

    manager.pushState("State1");
    manager.pushState("State2");

    auto state1Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State1"));
    auto state2Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State2"));

    BOOST_REQUIRE(state1Shared != nullptr);
    BOOST_REQUIRE(state2Shared != nullptr);

    state1Shared->resetFlags();
    state2Shared->resetFlags();

    manager.removeState("State2");

    BOOST_CHECK(state2Shared->wasExitCalled());
    BOOST_CHECK(state1Shared->wasResumeCalled());
    BOOST_CHECK(!manager.hasState("State2"));
    BOOST_CHECK(manager.getState("State2") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestRemoveNonexistentState) {
    BOOST_CHECK_NO_THROW(manager.removeState("NonexistentState"));
}

BOOST_AUTO_TEST_CASE(TestClearAllStates) {
    add("State1");
    add("State2");

    manager.pushState("State1");
    manager.pushState("State2");

    auto state1Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State1"));
    auto state2Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State2"));

    BOOST_REQUIRE(state1Shared != nullptr);
    BOOST_REQUIRE(state2Shared != nullptr);

    manager.clearAllStates();

    BOOST_CHECK(state1Shared->wasExitCalled());
    BOOST_CHECK(state2Shared->wasExitCalled());
    BOOST_CHECK(!manager.hasState("State1"));
    BOOST_CHECK(!manager.hasState("State2"));
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
