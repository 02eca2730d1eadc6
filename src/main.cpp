/*
 * Copyright (C) 2025 The debhost developers
 *
 * Licensed under the GNU Lesser General Public License Version 3
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the license, or
 * (at your option) any later version.
 *
 * This software is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this software.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "defines.h"

#include <iostream>
#include <filesystem>
#include <format>
#include <vector>
#include <string>
#include <clocale>

#include <glib.h>

#include "logging.h"
#include "config.h"
#include "engine.h"
#include "errors.h"
#include "utils.h"

using namespace DebHost;

/**
 * Exit codes of the debhost command.
 */
enum ExitCode {
    EXIT_OK = 0,
    EXIT_COMMAND_ERROR = 1,
    EXIT_DUPLICATE = 2,
    EXIT_PARSE_ERROR = 3,
    EXIT_CONFIG_ERROR = 4
};

/**
 * Print version information to stdout.
 */
static void printVersion()
{
    std::cout << "debhost version: " << DEBHOST_VERSION << std::endl;
}

/**
 * Execute the specified command with the given arguments.
 */
static int executeCommand(const std::string &command, const std::vector<std::string> &args, bool ignoreExisting)
{
    if (command == "ingest") {
        if (args.size() < 3) {
            std::cerr << "Invalid number of parameters: You need to specify at least one file to ingest."
                      << std::endl;
            return EXIT_COMMAND_ERROR;
        }
        Engine engine;
        engine.setIgnoreExisting(ignoreExisting);
        engine.ingest(std::vector<std::string>(args.begin() + 2, args.end()));
    } else if (command == "regenerate") {
        if (args.size() != 2) {
            std::cerr << "The regenerate command takes no parameters." << std::endl;
            return EXIT_COMMAND_ERROR;
        }
        Engine engine;
        engine.regenerate();
    } else if (command == "process-file") {
        if (args.size() != 4) {
            std::cerr << "Invalid number of parameters: You need to specify an architecture and a package file."
                      << std::endl;
            return EXIT_COMMAND_ERROR;
        }
        Engine engine;
        engine.setIgnoreExisting(ignoreExisting);
        engine.processFile(args[2], args[3]);
    } else if (command == "list") {
        if (args.size() > 3) {
            std::cerr << "Invalid number of parameters: You may only specify one architecture." << std::endl;
            return EXIT_COMMAND_ERROR;
        }
        Engine engine;
        engine.printCatalog(args.size() == 3 ? args[2] : "");
    } else {
        std::cerr << std::format("The command '{}' is unknown.", command) << std::endl;
        return EXIT_COMMAND_ERROR;
    }

    return EXIT_OK;
}

/**
 * Main function
 */
int main(int argc, char **argv)
{
    gboolean verbose = FALSE;
    gboolean showHelp = FALSE;
    gboolean showVersion = FALSE;
    gboolean ignoreExisting = FALSE;
    g_autofree gchar *wdir = nullptr;
    g_autofree gchar *configFname = nullptr;

    if (!setlocale(LC_ALL, ""))
        setlocale(LC_ALL, "C.UTF-8");
    // Release files and logs must never contain localized numbers
    std::setlocale(LC_NUMERIC, "C");

    GOptionEntry entries[] = {
        {"help", 'h', 0, G_OPTION_ARG_NONE, &showHelp, "Show help options", nullptr},
        {"verbose", 0, 0, G_OPTION_ARG_NONE, &verbose, "Show extra debugging information", nullptr},
        {"version", 0, 0, G_OPTION_ARG_NONE, &showVersion, "Show the program version", nullptr},
        {"ignore-exists",
         0,
         0,
         G_OPTION_ARG_NONE,
         &ignoreExisting,
         "Treat packages which are already in the catalog as successfully ingested",
         nullptr},
        {"workspace", 'w', 0, G_OPTION_ARG_STRING, &wdir, "Define the workspace location", "DIR"},
        {"config", 'c', 0, G_OPTION_ARG_STRING, &configFname, "Use the given configuration file", "FILE"},
        {nullptr}
    };

    g_autoptr(GError) error = nullptr;
    g_autoptr(GOptionContext) context = g_option_context_new("<subcommand> - APT repository host");

    g_option_context_set_description(
        context,
        "Subcommands:\n"
        "  ingest FILE|URL|DIR ...   - Add the given package files, or all packages below DIR, to the catalog.\n"
        "  regenerate                - Regenerate the repository indices for all architectures.\n"
        "  process-file ARCH FILE    - Add a package built for ARCH and regenerate the repository layout.\n"
        "  list [ARCH]               - Show the catalog contents.\n");

    g_option_context_set_summary(context, "Debian package repository host");
    g_option_context_add_main_entries(context, entries, nullptr);
    g_option_context_set_help_enabled(context, FALSE);

    if (!g_option_context_parse(context, &argc, &argv, &error)) {
        std::cerr << "Unable to parse parameters: " << error->message << std::endl;
        return EXIT_COMMAND_ERROR;
    }

    if (showHelp) {
        g_autofree gchar *helpText = g_option_context_get_help(context, TRUE, nullptr);
        std::cout << helpText << std::endl;
        return EXIT_OK;
    }

    if (showVersion) {
        printVersion();
        return EXIT_OK;
    }

    if (argc < 2) {
        std::cerr << "No subcommand specified!" << std::endl;
        g_autofree gchar *helpText = g_option_context_get_help(context, TRUE, nullptr);
        std::cerr << helpText << std::endl;
        return EXIT_COMMAND_ERROR;
    }

    std::vector<std::string> args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i)
        args.emplace_back(argv[i]);

    // globally enable verbose mode, if requested
    if (verbose)
        setVerbose(true);

    std::string configFilename;
    if (configFname) {
        configFilename = configFname;
    } else {
        const auto workspaceDir = wdir ? fs::path(wdir) : fs::current_path();
        configFilename = workspaceDir / "debhost-config.json";
    }

    try {
        Config::get().loadFromFile(configFilename, wdir ? wdir : "");
    } catch (const std::exception &e) {
        std::cerr << std::format("Unable to load configuration: {}", e.what()) << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    try {
        return executeCommand(args[1], args, ignoreExisting);
    } catch (const DuplicatePackage &e) {
        logError("{}", e.what());
        return EXIT_DUPLICATE;
    } catch (const ParseError &e) {
        logError("Invalid package: {}", e.what());
        return EXIT_PARSE_ERROR;
    } catch (const std::exception &e) {
        logError("Error executing command: {}", e.what());
        return EXIT_COMMAND_ERROR;
    }
}
