#include "CommandLine.hpp"
#include "Logger.hpp"

#include <getopt.h>

#include <cerrno>
#include <climits>
#include <cstdlib>

static const char *const SHORT_OPTIONS = "+:hblf:t:ws:ivd:";

static const struct option LONG_OPTIONS[] = {
    {"help", no_argument, nullptr, 'h'},
    {"heartbeat", no_argument, nullptr, 'b'},
    {"list", no_argument, nullptr, 'l'},
    {"logfile", required_argument, nullptr, 'f'},
    {"logtype", required_argument, nullptr, 't'},
    {"overwrite", no_argument, nullptr, 'w'},
    {"sensors", required_argument, nullptr, 's'},
    {"silent", no_argument, nullptr, 'i'},
    {"verbose", no_argument, nullptr, 'v'},
    {"loglevel", required_argument, nullptr, 'd'},
    {nullptr, 0, nullptr, 0}};

static const char *option_name(int opt)
{
    switch (opt) {
    case 'f':
        return "--logfile/-f";
    case 't':
        return "--logtype/-t";
    case 's':
        return "--sensors/-s";
    case 'd':
        return "--loglevel/-d";
    default:
        return "option";
    }
}

void CommandLine::print_usage(const char *prog, std::ostream &out)
{
    out << "usage: " << prog
        << " [-h] [--heartbeat] [--list] [--logfile FILENAME] [--logtype {CSV,SQLite}]"
           " [--overwrite] [--sensors SENSOR_ID [SENSOR_ID ...]] [--silent] [--verbose]"
           " [--loglevel LEVEL]\n";
}

void CommandLine::print_help(const char *prog, std::ostream &out)
{
    print_usage(prog, out);
    out << "\nGet sensor values from Tellstick temperature and humidity sensors and print them"
           " or log them to a file\n\n"
           "options:\n"
           "  -h, --help            show this help message and exit\n"
           "  -b, --heartbeat       print an updating character to the terminal while waiting for sensor events\n"
           "  -l, --list            list available sensors and exit\n"
           "  -f, --logfile FILENAME\n"
           "                        file to log sensor data to, created if it does not exist\n"
           "  -t, --logtype {CSV,SQLite}\n"
           "                        type of logfile (default: CSV)\n"
           "  -w, --overwrite       overwrite the logfile if it exists\n"
           "  -s, --sensors SENSOR_ID [SENSOR_ID ...]\n"
           "                        device IDs of sensors to print values from (default: all)\n"
           "  -i, --silent          do not print sensor values to the terminal\n"
           "  -v, --verbose         print verbose output\n"
           "  -d, --loglevel LEVEL  diagnostic log level: ERROR, WARN, NOTICE, INFO or DEBUG (default: WARN)\n";
}

bool CommandLine::parse_int(const char *text, int &value)
{
    if (text == nullptr || *text == '\0')
        return false;

    char *end = nullptr;
    errno = 0;
    long parsed = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX)
        return false;

    value = static_cast<int>(parsed);
    return true;
}

CommandLine::Result CommandLine::parse(int argc, char *argv[], Config &config,
                                       std::ostream &out, std::ostream &err)
{
    const char *prog = argc > 0 ? argv[0] : "telltemp";

    // Restart scanning, parse may be called more than once per process
    optind = 0;
    opterr = 0;

    auto usage_error = [&](const std::string &message) {
        print_usage(prog, err);
        err << prog << ": error: " << message << std::endl;
        return EXIT_USAGE;
    };

    int opt;
    while ((opt = getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(prog, out);
            return EXIT_OK;
        case 'b':
            config.console.heartbeat = true;
            break;
        case 'l':
            config.general.list = true;
            break;
        case 'f':
            config.logging.file = optarg;
            break;
        case 't': {
            std::string type = optarg;
            if (type == "CSV") {
                config.logging.type = LogType::CSV;
            } else if (type == "SQLite") {
                config.logging.type = LogType::SQLite;
            } else {
                return usage_error(std::string("argument --logtype/-t: invalid choice: '") + type +
                                   "' (choose from 'CSV', 'SQLite')");
            }
            break;
        }
        case 'w':
            config.logging.overwrite = true;
            break;
        case 's': {
            config.sensors.ids.clear();
            int id;
            if (!parse_int(optarg, id))
                return usage_error(std::string("argument --sensors/-s: invalid int value: '") + optarg + "'");
            config.sensors.ids.insert(id);

            // --sensors takes one or more IDs
            while (optind < argc && argv[optind][0] != '-') {
                if (!parse_int(argv[optind], id))
                    return usage_error(std::string("argument --sensors/-s: invalid int value: '") +
                                       argv[optind] + "'");
                config.sensors.ids.insert(id);
                optind++;
            }
            break;
        }
        case 'i':
            config.console.silent = true;
            break;
        case 'v':
            config.console.verbose = true;
            break;
        case 'd': {
            Logger::Level level;
            if (!Logger::parseLevel(optarg, level))
                return usage_error(std::string("argument --loglevel/-d: invalid choice: '") + optarg + "'");
            config.general.loglevel = optarg;
            break;
        }
        case ':':
            return usage_error(std::string("argument ") + option_name(optopt) + ": expected one argument");
        case '?':
        default:
            if (optopt != 0)
                return usage_error(std::string("unrecognized arguments: -") + static_cast<char>(optopt));
            return usage_error(std::string("unrecognized arguments: ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        std::string extra;
        for (int i = optind; i < argc; i++) {
            if (!extra.empty())
                extra += " ";
            extra += argv[i];
        }
        return usage_error("unrecognized arguments: " + extra);
    }

    return CONTINUE;
}
