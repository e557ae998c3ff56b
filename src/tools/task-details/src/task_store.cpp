#include "taskpad/details/task_store.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace taskpad::details
{

TaskStore::TaskStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

void TaskStore::load()
{
    std::vector<Task> loaded;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        tasks_ = std::move(loaded);
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open())
        throw TaskStoreError("Unable to open " + path_.string());

    try
    {
        nlohmann::json doc;
        file >> doc;
        if (doc.contains("tasks"))
        {
            for (const auto &entry : doc.at("tasks"))
            {
                Task task;
                task.id = entry.value("id", "");
                task.title = entry.value("title", "");
                task.details = entry.value("details", "");
                loaded.push_back(std::move(task));
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw TaskStoreError("Malformed task file " + path_.string() + ": " + e.what());
    }

    tasks_ = std::move(loaded);
    for (auto &task : tasks_)
    {
        if (task.id.empty())
            task.id = nextId();
    }
}

void TaskStore::save() const
{
    nlohmann::json doc;
    nlohmann::json tasksJson = nlohmann::json::array();
    for (const auto &task : tasks_)
    {
        nlohmann::json entry;
        entry["id"] = task.id;
        entry["title"] = task.title;
        entry["details"] = task.details;
        tasksJson.push_back(entry);
    }
    doc["tasks"] = tasksJson;

    std::error_code ec;
    if (path_.has_parent_path())
        std::filesystem::create_directories(path_.parent_path(), ec);

    std::ofstream file(path_);
    if (!file.is_open())
        throw TaskStoreError("Unable to write " + path_.string());
    file << doc.dump(2) << std::endl;
    if (!file)
        throw TaskStoreError("Unable to write " + path_.string());
}

const Task *TaskStore::find(const std::string &id) const noexcept
{
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Task &task) { return task.id == id; });
    return it != tasks_.end() ? &*it : nullptr;
}

Task &TaskStore::addTask(std::string title)
{
    Task task;
    task.id = nextId();
    task.title = std::move(title);
    tasks_.push_back(std::move(task));
    return tasks_.back();
}

void TaskStore::updateDetails(const std::string &id, const std::string &details)
{
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Task &task) { return task.id == id; });
    if (it == tasks_.end())
        throw TaskStoreError("Unknown task '" + id + "'");
    it->details = details;
    save();
}

void DetailsPersister::persist(const std::string &taskId, const std::string &details)
{
    try
    {
        store_.updateDetails(taskId, details);
    }
    catch (const TaskStoreError &e)
    {
        errors_.emplace_back(e.what());
    }
}

std::vector<std::string> DetailsPersister::takeErrors()
{
    std::vector<std::string> errors;
    errors.swap(errors_);
    return errors;
}

std::string TaskStore::nextId() const
{
    for (std::size_t n = tasks_.size() + 1;; ++n)
    {
        std::string candidate = "task-" + std::to_string(n);
        if (!find(candidate))
            return candidate;
    }
}

} // namespace taskpad::details
