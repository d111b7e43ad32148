#include "daytrack/core/UndoStack.hpp"

#include "daytrack/core/UndoCommand.hpp"

#include <algorithm>

namespace daytrack {
namespace core {

UndoStack::UndoStack(std::size_t limit)
    : m_limit(std::max<std::size_t>(1, limit))
{
    m_commands.reserve(m_limit);
}

UndoStack::~UndoStack() = default;

void UndoStack::push(std::unique_ptr<UndoCommand> command)
{
    if (!command) {
        return;
    }
    if (m_index < m_commands.size()) {
        m_commands.erase(m_commands.begin() + static_cast<long>(m_index), m_commands.end());
    }

    command->redo();
    m_commands.push_back(std::move(command));
    m_index = m_commands.size();
    trimToLimit();
}

bool UndoStack::canUndo() const
{
    return m_index > 0;
}

bool UndoStack::canRedo() const
{
    return m_index < m_commands.size();
}

bool UndoStack::undo()
{
    if (!canUndo()) {
        return false;
    }
    m_commands[m_index - 1]->undo();
    --m_index;
    return true;
}

bool UndoStack::redo()
{
    if (!canRedo()) {
        return false;
    }
    m_commands[m_index]->redo();
    ++m_index;
    return true;
}

void UndoStack::clear()
{
    m_commands.clear();
    m_index = 0;
}

std::size_t UndoStack::count() const
{
    return m_commands.size();
}

std::size_t UndoStack::limit() const
{
    return m_limit;
}

void UndoStack::setLimit(std::size_t limit)
{
    m_limit = std::max<std::size_t>(1, limit);
    trimToLimit();
}

QString UndoStack::undoText() const
{
    return canUndo() ? m_commands[m_index - 1]->text() : QString();
}

void UndoStack::trimToLimit()
{
    while (m_commands.size() > m_limit) {
        m_commands.erase(m_commands.begin());
        if (m_index > 0) {
            --m_index;
        }
    }
}

} // namespace core
} // namespace daytrack
