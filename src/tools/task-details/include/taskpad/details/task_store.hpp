#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskpad::details
{

struct Task
{
    std::string id;
    std::string title;
    std::string details;
};

class TaskStoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Tasks persisted as {"tasks": [{"id", "title", "details"}, ...]}.
class TaskStore
{
public:
    explicit TaskStore(std::filesystem::path path);

    const std::filesystem::path &path() const noexcept { return path_; }
    const std::vector<Task> &tasks() const noexcept { return tasks_; }

    // A missing file yields an empty store. Throws TaskStoreError when the
    // file exists but cannot be read or parsed.
    void load();
    // Throws TaskStoreError when the file cannot be written.
    void save() const;

    const Task *find(const std::string &id) const noexcept;
    Task &addTask(std::string title);
    // Replaces the details of `id` and saves. Throws TaskStoreError for an
    // unknown id or a failed write.
    void updateDetails(const std::string &id, const std::string &details);

private:
    std::string nextId() const;

    std::filesystem::path path_;
    std::vector<Task> tasks_;
};

/// Commit hook target: saves details through a TaskStore and keeps the
/// failures until someone takes them.
class DetailsPersister
{
public:
    explicit DetailsPersister(TaskStore &store) noexcept : store_(store) {}

    void persist(const std::string &taskId, const std::string &details);

    bool hasErrors() const noexcept { return !errors_.empty(); }
    // Returns the queued failures, oldest first, and clears the queue.
    std::vector<std::string> takeErrors();

private:
    TaskStore &store_;
    std::vector<std::string> errors_;
};

} // namespace taskpad::details
