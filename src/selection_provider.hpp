#pragma once

#include "common.hpp"
#include "shared_state.hpp"

class SelectionProvider {
  public:
    virtual ~SelectionProvider() = default;
    virtual TokenSet CurrentSelection() = 0;
};

// Selection edited by the CLI and stored under the main-owned "selection" key.
class StoreSelectionProvider : public SelectionProvider {
  public:
    explicit StoreSelectionProvider(SharedState &state) : m_State(state) {}

    TokenSet CurrentSelection() override {
        return m_State.Selection();
    }

  private:
    SharedState &m_State;
};
