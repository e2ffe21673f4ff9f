#pragma once

#include "lintel/client/Client.h"

namespace lintel {

// Client decorator placed between detectors and the embedding tool. Drops
// findings for disabled or ignored issues; every other call is forwarded.
class ReportingFilter : public Client {
public:
    explicit ReportingFilter(Client &delegate) : delegate_(delegate) {}

    Client &getDelegate() const { return delegate_; }

    void report(const Context &context, const Issue &issue,
                const std::optional<Location> &location, llvm::StringRef message,
                const std::any &data) override;

    using Client::log;
    void log(llvm::Error error, const llvm::Twine &message) override;

    Configuration &getConfiguration(const Project &project) override;
    llvm::ErrorOr<std::string> readFile(llvm::StringRef path) override;
    std::vector<std::string> getSourceFolders(const Project &project) override;
    std::vector<std::string> getClassFolders(const Project &project) override;
    MarkupParser *getMarkupParser() override;
    SourceParser *getSourceParser() override;
    ClassReader *getClassReader() override;
    Project &getProject(llvm::StringRef dir, llvm::StringRef referenceDir) override;

private:
    Client &delegate_;
};

} // namespace lintel
