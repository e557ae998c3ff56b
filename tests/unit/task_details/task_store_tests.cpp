#include <gtest/gtest.h>

#include "taskpad/details/task_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{

using taskpad::details::TaskStore;
using taskpad::details::TaskStoreError;

class TaskStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = std::filesystem::temp_directory_path() / ("taskpad-store-" + std::to_string(stamp));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void write(const std::filesystem::path &path, const std::string &contents)
    {
        std::ofstream out(path);
        out << contents;
    }

    std::filesystem::path dir;
};

} // namespace

TEST_F(TaskStoreTest, MissingFileLoadsEmpty)
{
    TaskStore store(dir / "absent.json");
    store.load();
    EXPECT_TRUE(store.tasks().empty());
}

TEST_F(TaskStoreTest, MalformedFileThrows)
{
    write(dir / "broken.json", "{\"tasks\": [");
    TaskStore store(dir / "broken.json");
    EXPECT_THROW(store.load(), TaskStoreError);
}

TEST_F(TaskStoreTest, LoadsTasksAndFillsMissingIds)
{
    write(dir / "tasks.json",
          R"({"tasks": [{"id": "a", "title": "First", "details": "- [ ] one"}, {"title": "Second"}]})");
    TaskStore store(dir / "tasks.json");
    store.load();

    ASSERT_EQ(2u, store.tasks().size());
    EXPECT_EQ("a", store.tasks()[0].id);
    EXPECT_EQ("- [ ] one", store.tasks()[0].details);
    EXPECT_FALSE(store.tasks()[1].id.empty());
    EXPECT_EQ("", store.tasks()[1].details);
}

TEST_F(TaskStoreTest, UpdateDetailsPersists)
{
    const auto path = dir / "nested" / "tasks.json";
    TaskStore store(path);
    const std::string id = store.addTask("Write report").id;
    store.updateDetails(id, "Hello **World**\nline two");

    TaskStore reloaded(path);
    reloaded.load();
    const auto *task = reloaded.find(id);
    ASSERT_NE(nullptr, task);
    EXPECT_EQ("Write report", task->title);
    EXPECT_EQ("Hello **World**\nline two", task->details);
}

TEST_F(TaskStoreTest, UnknownIdThrows)
{
    TaskStore store(dir / "tasks.json");
    EXPECT_THROW(store.updateDetails("missing", "x"), TaskStoreError);
}

TEST_F(TaskStoreTest, GeneratedIdsAreUnique)
{
    TaskStore store(dir / "tasks.json");
    const std::string first = store.addTask("one").id;
    const std::string second = store.addTask("two").id;
    EXPECT_NE(first, second);
}

TEST_F(TaskStoreTest, PersisterQueuesFailedSaves)
{
    // A regular file where the store expects a directory makes every save fail.
    write(dir / "blocker", "");
    TaskStore store(dir / "blocker" / "tasks.json");
    const std::string id = store.addTask("Write report").id;
    taskpad::details::DetailsPersister persister(store);

    persister.persist(id, "draft");
    persister.persist("task-missing", "other");

    ASSERT_TRUE(persister.hasErrors());
    const auto errors = persister.takeErrors();
    ASSERT_EQ(2u, errors.size());
    EXPECT_NE(std::string::npos, errors[0].find("tasks.json"));
    EXPECT_NE(std::string::npos, errors[1].find("task-missing"));
    EXPECT_FALSE(persister.hasErrors());
    EXPECT_TRUE(persister.takeErrors().empty());
}

TEST_F(TaskStoreTest, PersisterSavesWithoutErrors)
{
    TaskStore store(dir / "tasks.json");
    const std::string id = store.addTask("Write report").id;
    taskpad::details::DetailsPersister persister(store);

    persister.persist(id, "done");

    EXPECT_FALSE(persister.hasErrors());
    TaskStore reloaded(dir / "tasks.json");
    reloaded.load();
    ASSERT_NE(nullptr, reloaded.find(id));
    EXPECT_EQ("done", reloaded.find(id)->details);
}
