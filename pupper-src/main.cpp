
#include <stdlib.h> // strtoull, exit

#include "fs/path.hpp"
#include "shl/assert.hpp"
#include "shl/array.hpp"
#include "shl/string.hpp"
#include "shl/format.hpp"
#include "shl/io.hpp"
#include "shl/compare.hpp"
#include "shl/print.hpp"
#include "shl/error.hpp"
#include "shl/defer.hpp"
#include "pup/pup.hpp"
#include "pup/pup_reader.hpp"
#include "pup/pup_writer.hpp"
#include "pup/pup_printer.hpp"
#include "pup/segment_ids.hpp"

#include "pupper_info.hpp"

struct arguments
{
    bool verbose;        // -v
    bool force;          // -f
    s64 index;           // -n
    bool has_id;
    u64 id;              // -x
    u64 image_version;   // -g
    array<const_string> positional; // command, pup file, segment file
};

static const arguments default_arguments
{
    .verbose = false,
    .force = false,
    .index = 0,
    .has_id = false,
    .id = 0,
    .image_version = 0
};

static void init(arguments *args)
{
    assert(args != nullptr);
    init(&args->positional);
}

static void free(arguments *args)
{
    assert(args != nullptr);
    free(&args->positional);
}

static char _getchar(error *err)
{
    char ret = 0;

    if (io_read(stdin_handle(), &ret, 1, err) != 1)
        return (char)-1;

    return ret;
}

static char _choice_prompt(const char *message, const char *choices, arguments *args, error *err)
{
    if (args->force)
        return *choices;

    char c;
    char input;

    do
    {
        put("\n");
        put(message);

        do
        {
            input = _getchar(err);
        }
        while (is_space(input) && input != (char)-1);

        if (input == (char)-1)
            return 'x';

        c = to_lower(input);
    }
    while (index_of(choices, c) == -1);

    return c;
}

// false if the user does not want path to be overwritten
static bool _confirm_overwrite(const char *path, arguments *args, error *err)
{
    fs::path p{};
    fs::set_path(&p, path);
    defer { fs::free(&p); };

    if (!fs::exists(&p))
        return true;

    if (!fs::is_file(&p))
    {
        format_error(err, 2, "output file exists but is not a file: %s", path);
        return false;
    }

    auto msg = tformat("output file %s already exists. overwrite? [y / n]: ", path);
    char choice = _choice_prompt(msg.c_str, "yn", args, err);

    if (choice != 'y')
    {
        put("aborting");
        exit(0);
    }

    return true;
}

static const char *_file_name(const char *path)
{
    const char *ret = path;

    for (const char *c = path; *c != '\0'; ++c)
        if (*c == '/' || *c == '\\')
            ret = c + 1;

    return ret;
}

static bool _parse_u64(const char *str, u64 *out, error *err)
{
    char *end = nullptr;
    *out = strtoull(str, &end, 0);

    if (end == str || *end != '\0')
    {
        format_error(err, 1, "not a number: '%s'", str);
        return false;
    }

    return true;
}

static const char *_pup_path(arguments *args, error *err)
{
    if (args->positional.size < 2)
    {
        set_error(err, 1, "no pup file specified");
        return nullptr;
    }

    return args->positional[1].c_str;
}

static const char *_segment_path(arguments *args, error *err)
{
    if (args->positional.size < 3)
    {
        set_error(err, 1, "no segment file specified");
        return nullptr;
    }

    return args->positional[2].c_str;
}

static bool _create(arguments *args, error *err)
{
    const char *path = _pup_path(args, err);

    if (path == nullptr)
        return false;

    if (!_confirm_overwrite(path, args, err))
        return false;

    pup p{};
    init(&p);
    defer { free(&p); };

    p.image_version = args->image_version;

    if (args->verbose)
        tprint("creating empty pup %s with image version 0x%x\n", path, p.image_version);

    return pup_write_to_file(&p, path, err);
}

static bool _print(arguments *args, error *err)
{
    const char *path = _pup_path(args, err);

    if (path == nullptr)
        return false;

    pup p{};
    init(&p);
    defer { free(&p); };

    if (!pup_load_from_path(&p, path, err))
        return false;

    tprint("contents of pup %s:\n", path);
    pup_print(stdout_handle(), &p, args->verbose);

    return true;
}

static bool _extract(arguments *args, error *err)
{
    const char *path = _pup_path(args, err);

    if (path == nullptr)
        return false;

    const char *seg_path = _segment_path(args, err);

    if (seg_path == nullptr)
        return false;

    pup p{};
    init(&p);
    defer { free(&p); };

    if (!pup_load_from_path(&p, path, err))
        return false;

    pup_segment *seg = pup_get_segment(&p, args->index);

    if (seg == nullptr)
    {
        format_error(err, PUP_ERROR_INDEX_OUT_OF_BOUNDS, "index % is out of bounds (% segments)", args->index, p.segments.size);
        return false;
    }

    if (!_confirm_overwrite(seg_path, args, err))
        return false;

    if (args->verbose)
        tprint("  %08x bytes %s\n", seg->data.size, seg_path);

    return pup_segment_write_to_file(seg, seg_path, err);
}

static bool _insert(arguments *args, error *err)
{
    const char *path = _pup_path(args, err);

    if (path == nullptr)
        return false;

    const char *seg_path = _segment_path(args, err);

    if (seg_path == nullptr)
        return false;

    pup p{};
    init(&p);
    defer { free(&p); };

    if (!pup_load_from_path(&p, path, err))
        return false;

    pup_segment seg{};
    init(&seg);
    defer { free(&seg); };

    if (!pup_segment_load_from_path(&seg, seg_path, err))
        return false;

    if (args->has_id)
        seg.id = args->id;
    else if (!pup_segment_id_from_name(_file_name(seg_path), &seg.id))
        seg.id = 0;

    if (args->verbose)
        tprint("inserting %s (id 0x%x, % bytes) at index %\n", seg_path, seg.id, seg.data.size, args->index);

    if (!pup_insert_segment(&p, args->index, &seg, err))
        return false;

    return pup_write_to_file(&p, path, err);
}

static bool _remove(arguments *args, error *err)
{
    const char *path = _pup_path(args, err);

    if (path == nullptr)
        return false;

    pup p{};
    init(&p);
    defer { free(&p); };

    if (!pup_load_from_path(&p, path, err))
        return false;

    if (args->verbose)
        tprint("removing segment % of %\n", args->index, p.segments.size);

    if (!pup_remove_segment(&p, args->index, err))
        return false;

    return pup_write_to_file(&p, path, err);
}

static void _show_help_and_exit()
{
    put(pupper_NAME R"( [-h] [-v] [-f] [-n <index>] [-x <id>] [-g <version>] <command> <pup> [<segment>]
  v)"   pupper_VERSION R"(
  by )" pupper_AUTHOR R"(

Creates, prints and edits PS3 update packages (PUP).

COMMANDS:
  create        Create an empty pup with image version -g.
  print         Print the image version and segments of the pup.
  extract       Write the data of segment -n to <segment>.
  insert        Insert the file <segment> as segment -n.
  remove        Remove segment -n, or the last segment if -n is past the end.

ARGUMENTS:
  -h            Show this help and exit.
  -v            Show verbose output.
  -f            Force overwrite any files without prompting.
  -n <index>    The segment index, defaults to 0.
  -x <id>       The id of an inserted segment. Defaults to the id of the known
                file name of <segment>, or 0.
  -g <version>  The image version of a created pup, defaults to 0.

  <pup>         The pup file.
  <segment>     The segment file to extract to or insert from.
)");

    exit(0);
}

#define _next_arg(Var, Argc, Argv, I)\
    {\
        if ((I) >= (Argc) - 1)\
        {\
            format_error(err, 1, "argument '%s' missing parameter", (Argv)[(I)]);\
            return false;\
        }\
    \
        I += 1;\
        Var = (Argv)[(I)];\
    }

static bool _parse_arguments(int argc, char **argv, arguments *args, error *err)
{
    for (int i = 1; i < argc; ++i)
    {
        const_string arg = to_const_string(argv[i]);

        if (arg == "-h"_cs)
        {
            _show_help_and_exit();
            continue;
        }

        if (arg == "-v"_cs)
        {
            args->verbose = true;
            continue;
        }

        if (arg == "-f"_cs)
        {
            args->force = true;
            continue;
        }

        if (arg == "-n"_cs)
        {
            const char *narg;
            _next_arg(narg, argc, argv, i);

            u64 index = 0;

            if (!_parse_u64(narg, &index, err))
                return false;

            args->index = (s64)index;
            continue;
        }

        if (arg == "-x"_cs)
        {
            const char *narg;
            _next_arg(narg, argc, argv, i);

            if (!_parse_u64(narg, &args->id, err))
                return false;

            args->has_id = true;
            continue;
        }

        if (arg == "-g"_cs)
        {
            const char *narg;
            _next_arg(narg, argc, argv, i);

            if (!_parse_u64(narg, &args->image_version, err))
                return false;

            continue;
        }

        if (compare_strings(arg, "-"_cs, 1) == 0)
        {
            format_error(err, 1, "unexpected argument '%s'", arg);
            return false;
        }

        add_at_end(&args->positional, arg);
    }

    return true;
}

static bool _main(int argc, char **argv, error *err)
{
    arguments args = default_arguments;
    init(&args);
    defer { free(&args); };

    if (!_parse_arguments(argc, argv, &args, err))
        return false;

    if (args.positional.size == 0)
    {
        set_error(err, 1, "no command");
        return false;
    }

    if (args.positional.size > 3)
    {
        set_error(err, 1, "too many arguments");
        return false;
    }

    const_string command = args.positional[0];
    bool ret = false;

    if (command == "create"_cs)
        ret = _create(&args, err);
    else if (command == "print"_cs)
        return _print(&args, err);
    else if (command == "extract"_cs)
        ret = _extract(&args, err);
    else if (command == "insert"_cs)
        ret = _insert(&args, err);
    else if (command == "remove"_cs)
        ret = _remove(&args, err);
    else
    {
        format_error(err, 1, "unknown command '%s'", command);
        return false;
    }

    if (!ret)
        return false;

    put("done");
    return true;
}

int main(int argc, char **argv)
{
    error err{};

    if (!_main(argc, argv, &err))
    {
#ifndef NDEBUG
        tprint("[%:%] error %: %\n", err.file, (s64)err.line, err.error_code, err.what);
#else
        tprint("error %: %\n", err.error_code, err.what);
#endif
        return 1;
    }

    return 0;
}
