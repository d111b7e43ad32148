#pragma once

#include <QString>

namespace daytrack {
namespace core {

class UndoCommand
{
public:
    virtual ~UndoCommand() = default;
    virtual void redo() = 0;
    virtual void undo() = 0;
    virtual QString text() const = 0;
};

} // namespace core
} // namespace daytrack
