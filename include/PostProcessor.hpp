#pragma once

#include "TransferTypes.hpp"
#include "ThreadPool.hpp"
#include <atomic>
#include <string>
#include <utility>
#include <vector>

struct PostProcessRequest
{
    JobId Job;
    TaskId Task;
    std::string Path;
    std::string Checksum;
};

// Receives completed files. Offer must return without waiting for the work.
class PostProcessor
{
public:
    virtual ~PostProcessor() = default;
    virtual void Offer(const PostProcessRequest& Request) = 0;
};

namespace ShellCommand
{
    // Double-quoted, with $ \ " ` escaped
    std::string Quote(const std::string& Value);

    // Replaces each {token} with the quoted value.
    std::string Expand(const std::string& Template, const std::vector<std::pair<std::string, std::string>>& Tokens);

    // Exit status of the command, -1 if it could not be run or was killed.
    int Run(const std::string& Command);
}

// Runs a shell command per completed file, e.g. "thumbnailer {path} --md5 {checksum}".
class ExternalCommandPostProcessor : public PostProcessor
{
public:
    explicit ExternalCommandPostProcessor(std::string CommandTemplate, size_t ThreadCount = 1);

    void Offer(const PostProcessRequest& Request) override;

    // Blocks until every offered command has run.
    void Drain();

    size_t FailureCount() const { return Failures.load(); }

private:
    std::string CommandTemplate;
    std::atomic<size_t> Failures{ 0 };
    ThreadPool Pool;
};
