#include "PostProcessor.hpp"
#include "Logger.hpp"
#include <cstdlib>
#include <sys/wait.h>

namespace ShellCommand
{
    std::string Quote(const std::string& Value)
    {
        std::string Output = "\"";
        for (char c : Value)
        {
            if (c == '$' || c == '\\' || c == '"' || c == '`')
            {
                Output += '\\';
            }
            Output += c;
        }
        Output += '"';
        return Output;
    }

    std::string Expand(const std::string& Template, const std::vector<std::pair<std::string, std::string>>& Tokens)
    {
        std::string Command = Template;
        for (const auto& [Token, Value] : Tokens)
        {
            const std::string Placeholder = "{" + Token + "}";
            const std::string Quoted = Quote(Value);
            size_t Pos = 0;
            while ((Pos = Command.find(Placeholder, Pos)) != std::string::npos)
            {
                Command.replace(Pos, Placeholder.size(), Quoted);
                Pos += Quoted.size();
            }
        }
        return Command;
    }

    int Run(const std::string& Command)
    {
        int Status = std::system(Command.c_str());
        if (Status == -1 || !WIFEXITED(Status))
        {
            return -1;
        }
        return WEXITSTATUS(Status);
    }
}

ExternalCommandPostProcessor::ExternalCommandPostProcessor(std::string CommandTemplate, size_t ThreadCount)
    : CommandTemplate(std::move(CommandTemplate)), Pool(ThreadCount)
{
}

void ExternalCommandPostProcessor::Offer(const PostProcessRequest& Request)
{
    Pool.Submit([this, Request]()
    {
        std::string Command = ShellCommand::Expand(CommandTemplate, { { "path", Request.Path }, { "checksum", Request.Checksum } });
        Log.Info("[PostProcessor] " + Request.Task + ": " + Command);

        int ExitCode = ShellCommand::Run(Command);
        if (ExitCode != 0)
        {
            ++Failures;
            Log.Error("[PostProcessor] Command for " + Request.Path + " exited with " + std::to_string(ExitCode));
        }
    });
}

void ExternalCommandPostProcessor::Drain()
{
    Pool.Join();
}
