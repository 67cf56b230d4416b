#include <FileJsonStorage.hpp>
#include <LocalCacheStore.hpp>
#include <RemoteStore.hpp>
#include <ShopTemplates.hpp>
#include <SyncEngine.hpp>
#include <WorkspaceRegistry.hpp>
#include <WorkspaceSwitcher.hpp>
#include <config.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <sstream>

using namespace NWorkspace;

namespace {

    bool Confirm(const std::string& question) {
        std::cout << question << " [y/N] ";
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        return answer == "y" || answer == "Y" || answer == "yes";
    }

    std::string RestOfLine(std::istringstream& iss) {
        std::string rest;
        std::getline(iss, rest);
        auto first = rest.find_first_not_of(' ');
        return first == std::string::npos ? std::string() : rest.substr(first);
    }

    void PrintWorkspace(const TWorkspace& w, bool current) {
        std::cout << (current ? "* " : "  ") << w.Id << " \"" << w.Name << "\" " << w.ShopType << " " << w.Currency
                  << " code=" << MaskCompanyCode(w.CompanyCode, 2)
                  << (w.IsDefault ? " [default]" : "")
                  << " sync=" << ToString(w.SyncStatus) << "\n";
    }

    void PrintHelp() {
        std::cout << "Workspace manager. Commands:\n"
                  << "  list                                  -- known workspaces, * marks the current one\n"
                  << "  create <shop_type> <currency> <name>  -- new workspace with a fresh company code and starter items\n"
                  << "  join <company_code> <name>            -- add an existing workspace\n"
                  << "  switch <id>                           -- move to another workspace\n"
                  << "  sync                                  -- push local changes and pull the current workspace\n"
                  << "  remove <id>                           -- forget a workspace on this device\n"
                  << "  default <id>\n"
                  << "  rename <id> <name>\n"
                  << "  address <id> <address>\n"
                  << "  code [reveal]                         -- company code of the current workspace\n"
                  << "  tables\n"
                  << "  put <table> <id> <json>\n"
                  << "  get <table> <id>\n"
                  << "  rm <table> <id>\n"
                  << "  ls <table>\n"
                  << "  pending                               -- local changes not yet pushed\n"
                  << "  restore                               -- load the workspace list published for --account\n"
                  << "  status\n"
                  << "  ack                                   -- acknowledge the last failure\n"
                  << "  signout                               -- forget every workspace and wipe local data\n"
                  << "  exit\n";
    }

} // namespace

int main(int argc, char* argv[]) {
    std::optional<TAppConfig> config;
    try {
        config = ParseConfig(argc, argv, std::cout);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }
    if (!config) {
        return 0;
    }

    std::shared_ptr<TWorkspaceRegistry> registry;
    std::shared_ptr<TLocalCacheStore> cache;
    std::shared_ptr<IRemoteStore> remote;
    try {
        SetupLogging(*config);
        std::filesystem::create_directories(config->DataDir);
        std::filesystem::create_directories(config->RemoteDir);

        registry = std::make_shared<TWorkspaceRegistry>(std::make_shared<TFileJsonStorage>(
            config->DataDir / "registry.json", config->DataDir / "registry.journal"));
        cache = std::make_shared<TLocalCacheStore>(std::make_shared<TFileJsonStorage>(
            config->DataDir / "cache.json", config->DataDir / "cache.journal"));
        remote = std::make_shared<TFileRemoteStore>(config->RemoteDir);
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 1;
    }

    auto sync = std::make_shared<TSyncEngine>(registry, cache, remote, config->Retry);
    TWorkspaceSwitcher switcher(registry, cache, sync);
    spdlog::info("Data in {}, remote in {}", config->DataDir.string(), config->RemoteDir.string());

    const std::string account = config->Account;
    auto publish = [&] {
        if (account.empty()) {
            return;
        }
        try {
            sync->PublishWorkspaceList(account);
        } catch (const TWorkspaceError& e) {
            spdlog::warn("Workspace list not published: {}", e.what());
        }
    };

    if (!account.empty() && registry->Size() == 0) {
        try {
            if (auto added = sync->RestoreWorkspaceList(account)) {
                std::cout << "Loaded " << added << " workspace(s) published for " << account << "\n";
                switcher.SyncCurrent();
            }
        } catch (const TWorkspaceError& e) {
            spdlog::warn("Cannot load the published workspace list: {}", e.what());
        }
    }

    PrintHelp();

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        try {
            if (cmd == "help") {
                PrintHelp();
                continue;
            }

            if (cmd == "list") {
                auto currentId = registry->CurrentId();
                auto all = registry->List();
                if (all.empty()) {
                    std::cout << "No workspaces. Use create or join.\n";
                }
                for (auto& w : all) {
                    PrintWorkspace(w, currentId && *currentId == w.Id);
                }
                continue;
            }

            if (cmd == "create") {
                TWorkspace w;
                iss >> w.ShopType >> w.Currency;
                w.Name = RestOfLine(iss);
                if (w.ShopType.empty() || w.Currency.empty() || w.Name.empty()) {
                    std::cout << "Usage: create <shop_type> <currency> <name>\n";
                    continue;
                }
                w.CompanyCode = GenerateCompanyCode();
                // the first submit creates the remote record set, even when there is nothing to seed
                auto starter = StarterMutations(w.ShopType);
                remote->Submit(w.CompanyCode, starter);
                bool first = !registry->CurrentId();
                auto added = registry->Add(w);
                std::cout << "Created " << added.Id << " with company code " << added.CompanyCode
                          << " (share it to let other devices join)\n";
                if (!starter.empty()) {
                    std::cout << "Seeded " << starter.size() << " starter categories and products for " << w.ShopType << "\n";
                }
                publish();
                if (first) {
                    switcher.SyncCurrent();
                }
                continue;
            }

            if (cmd == "join") {
                std::string code;
                iss >> code;
                std::string name = RestOfLine(iss);
                if (code.empty() || name.empty()) {
                    std::cout << "Usage: join <company_code> <name>\n";
                    continue;
                }
                if (auto known = registry->FindByCompanyCode(code)) {
                    std::cout << "Already joined as " << known->Id << "\n";
                    continue;
                }
                TWorkspace w;
                w.Name = name;
                w.CompanyCode = code;
                auto snapshot = sync->Pull(w);
                bool first = !registry->CurrentId();
                auto added = registry->Add(w);
                std::cout << "Joined " << added.Id << " (" << snapshot.RecordCount() << " remote records)\n";
                publish();
                if (first) {
                    switcher.SyncCurrent();
                }
                continue;
            }

            if (cmd == "switch") {
                std::string id;
                iss >> id;
                if (id.empty()) {
                    std::cout << "Usage: switch <id>\n";
                    continue;
                }
                auto preview = switcher.PreviewSwitch(id);
                std::string from = preview.Source ? "\"" + preview.Source->Name + "\"" : "no workspace";
                if (!Confirm("Switch from " + from + " to \"" + preview.Target.Name + "\"?")) {
                    std::cout << "Switch aborted\n";
                    continue;
                }
                auto now = switcher.RequestSwitch(id);
                std::cout << "Now working in \"" << now.Name << "\" (" << cache->TotalCount() << " records)\n";
                continue;
            }

            if (cmd == "sync") {
                auto outcome = switcher.SyncCurrent();
                std::cout << (outcome == ESyncOutcome::Deferred ? "Sync deferred until the running switch ends" : "Synced") << "\n";
                continue;
            }

            if (cmd == "remove") {
                std::string id;
                iss >> id;
                auto res = switcher.DeleteWorkspace(id);
                std::cout << "Removed \"" << res.Removed.Name << "\"; rejoin later with its company code\n";
                if (res.WasDefault) {
                    std::cout << "It was the default workspace; pick a new one with default <id>\n";
                }
                publish();
                continue;
            }

            if (cmd == "default") {
                std::string id;
                iss >> id;
                registry->SetDefault(id);
                std::cout << "Default set to " << id << "\n";
                publish();
                continue;
            }

            if (cmd == "rename" || cmd == "address") {
                std::string id;
                iss >> id;
                std::string value = RestOfLine(iss);
                TWorkspacePatch patch;
                if (cmd == "rename") {
                    patch.Name = value;
                } else {
                    patch.Address = value;
                }
                auto w = registry->Update(id, patch);
                PrintWorkspace(w, registry->CurrentId() == w.Id);
                publish();
                continue;
            }

            if (cmd == "code") {
                auto current = switcher.CurrentWorkspace();
                if (!current) {
                    std::cout << "No current workspace\n";
                    continue;
                }
                std::string mode;
                iss >> mode;
                std::cout << (mode == "reveal" ? current->CompanyCode : MaskCompanyCode(current->CompanyCode)) << "\n";
                continue;
            }

            if (cmd == "tables") {
                for (auto& name : cache->TableNames()) {
                    std::cout << "  " << name << " (" << cache->Count(name) << ")\n";
                }
                continue;
            }

            if (cmd == "put") {
                std::string table;
                std::string id;
                iss >> table >> id;
                std::string body = RestOfLine(iss);
                if (!switcher.CurrentWorkspace()) {
                    std::cout << "No current workspace\n";
                    continue;
                }
                json data = body.empty() ? json::object() : json::parse(body);
                auto rec = cache->Upsert(table, id, data);
                std::cout << "Saved " << rec.Table << "/" << rec.Id << "\n";
                continue;
            }

            if (cmd == "get") {
                std::string table;
                std::string id;
                iss >> table >> id;
                auto rec = cache->Get(table, id);
                if (rec) {
                    std::cout << rec->Data.dump() << "\n";
                } else {
                    std::cout << "Not found\n";
                }
                continue;
            }

            if (cmd == "rm") {
                std::string table;
                std::string id;
                iss >> table >> id;
                std::cout << (cache->Remove(table, id) ? "Removed" : "Not found") << "\n";
                continue;
            }

            if (cmd == "ls") {
                std::string table;
                iss >> table;
                for (auto& rec : cache->List(table)) {
                    std::cout << "  " << rec.Id << " " << rec.Data.dump() << "\n";
                }
                continue;
            }

            if (cmd == "pending") {
                for (auto& m : cache->PendingMutations()) {
                    std::cout << "  " << m.MutationId << " " << (m.Op == EMutationOp::Upsert ? "upsert " : "remove ")
                              << m.Table << "/" << m.RecordId << "\n";
                }
                for (auto& [code, parked] : cache->ParkedMutations()) {
                    std::cout << "  " << parked.size() << " write(s) waiting for " << MaskCompanyCode(code, 2) << "\n";
                }
                continue;
            }

            if (cmd == "restore") {
                if (account.empty()) {
                    std::cout << "Start with --account to use a published workspace list\n";
                    continue;
                }
                auto added = sync->RestoreWorkspaceList(account);
                std::cout << "Added " << added << " workspace(s)\n";
                continue;
            }

            if (cmd == "status") {
                auto current = switcher.CurrentWorkspace();
                std::cout << "state=" << ToString(switcher.State())
                          << " current=" << (current ? current->Id : "<none>")
                          << " cache_owner=" << (cache->OwnerId().empty() ? "<none>" : cache->OwnerId())
                          << " pending=" << cache->PendingMutations().size() << "\n";
                if (auto failure = switcher.PendingFailure()) {
                    std::cout << "Unacknowledged failure: " << failure->what() << "\n";
                }
                continue;
            }

            if (cmd == "ack") {
                std::cout << (switcher.Acknowledge() ? "Acknowledged" : "Nothing to acknowledge") << "\n";
                continue;
            }

            if (cmd == "signout") {
                if (!Confirm("Forget every workspace and wipe local data?")) {
                    continue;
                }
                switcher.SignOutAll();
                std::cout << "Signed out\n";
                continue;
            }

            std::cout << "Unknown command\n";
        } catch (const TWorkspaceError& ex) {
            std::cout << "Error: " << ex.what() << "\n";
            if (ex.IsTerminal()) {
                std::cout << "Run ack to continue\n";
            }
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    spdlog::shutdown();
    return 0;
}
