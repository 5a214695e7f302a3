#pragma once
#include <string>
namespace retrochat::vault::interfaces {

/** Callbacks fired by KeyHierarchyManager after each state transition. */
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnSessionUnlocked(const std::string& address) = 0;
    virtual void OnSessionLocked() = 0;
};

}
