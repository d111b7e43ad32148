#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <QString>

namespace daytrack {
namespace core {

class UndoCommand;

// Bounded history; the oldest command is dropped once `limit` is reached.
class UndoStack
{
public:
    explicit UndoStack(std::size_t limit = 10);
    ~UndoStack();

    // Executes the command and records it, discarding anything redoable.
    void push(std::unique_ptr<UndoCommand> command);
    bool canUndo() const;
    bool canRedo() const;
    bool undo();
    bool redo();
    void clear();
    std::size_t count() const;
    std::size_t limit() const;
    void setLimit(std::size_t limit);
    QString undoText() const;

private:
    void trimToLimit();

    std::vector<std::unique_ptr<UndoCommand>> m_commands;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace daytrack
