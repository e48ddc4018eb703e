#define BOOST_TEST_MODULE Block Dispatch Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "block.hpp"
#include "error.hpp"
#include "ffi/dispatch.hpp"
#include "ffi/protect.hpp"
#include "ruby_fixture.hpp"
#include "runtime.hpp"
#include "value_box.hpp"
#include "values.hpp"

#include <stdexcept>

using namespace garnet;

static string inspect(rvalue v) {
    string res;
    BOOST_REQUIRE((vget_string(res, check_status(protect_inspect(v)))));
    return res;
}

static long to_long(rvalue v) {
    long res = 0;
    check_status(protect_to_long(res, v));
    return res;
}

static const dyn_array<rooted_value> no_args;

BOOST_AUTO_TEST_CASE( block_value_test ) {
    auto arr = eval("[1, 2, 3]");
    dyn_array<long> seen;
    auto res = call_with_block(arr.get(), "each", no_args,
            [&seen](const dyn_array<rooted_value>& args) {
                BOOST_TEST((args.size() == 1));
                seen.push_back(to_long(args[0].get()));
                return rooted_value{};
            });
    // each returns its receiver
    BOOST_TEST((res.get() == arr.get()));
    BOOST_TEST((seen == (dyn_array<long>{1, 2, 3})));

    res = call_with_block(arr.get(), "map", no_args,
            [](const dyn_array<rooted_value>& args) {
                return rooted_value{vbox_long(to_long(args[0].get()) * 2)};
            });
    BOOST_TEST((inspect(res.get()) == "[2, 4, 6]"));

    // several yielded values
    dyn_array<long> indexes;
    call_with_block(arr.get(), "each_with_index", no_args,
            [&indexes](const dyn_array<rooted_value>& args) {
                BOOST_TEST((args.size() == 2));
                indexes.push_back(to_long(args[1].get()));
                return rooted_value{};
            });
    BOOST_TEST((indexes == (dyn_array<long>{0, 1, 2})));
}

BOOST_AUTO_TEST_CASE( block_args_test ) {
    auto arr = eval("[1, 2, 3, 4]");
    dyn_array<rooted_value> args;
    args.emplace_back(vbox_long(10));
    auto res = call_with_block(arr.get(), "inject", args,
            [](const dyn_array<rooted_value>& args) {
                return rooted_value{
                    vbox_long(to_long(args[0].get()) + to_long(args[1].get()))};
            });
    BOOST_TEST((res.get() == vbox_long(20)));
}

BOOST_AUTO_TEST_CASE( block_break_test ) {
    auto arr = eval("[1, 2, 3, 4]");
    int calls = 0;
    auto res = call_with_block(arr.get(), "each", no_args,
            [&calls](const dyn_array<rooted_value>& args) -> rooted_value {
                ++calls;
                if (to_long(args[0].get()) == 2) {
                    throw iter_break{};
                }
                return rooted_value{};
            });
    BOOST_TEST((calls == 2));
    BOOST_TEST((res.get() == RV_NIL));

    calls = 0;
    res = call_with_block(arr.get(), "each", no_args,
            [&calls](const dyn_array<rooted_value>& args) -> rooted_value {
                ++calls;
                if (to_long(args[0].get()) == 3) {
                    throw iter_break{eval("'stopped'").get()};
                }
                return rooted_value{};
            });
    BOOST_TEST((calls == 3));
    BOOST_TEST((inspect(res.get()) == "\"stopped\""));
}

BOOST_AUTO_TEST_CASE( block_raise_test ) {
    auto arr = eval("[1, 2]");
    auto klass = eval("ArgumentError");
    try {
        call_with_block(arr.get(), "each", no_args,
                [&klass](const dyn_array<rooted_value>&) -> rooted_value {
                    auto exc = check_status(protect_exc_new(klass.get(), "from host"));
                    throw ruby_exception{exc};
                });
        BOOST_FAIL("exception not raised");
    } catch (const ruby_exception& e) {
        BOOST_TEST((vclass_name(e.exception()) == "ArgumentError"));
        BOOST_TEST((e.message == "ArgumentError: from host"));
    }

    // Ruby code between us and the block can rescue it
    auto rescuer = eval(
            "class BlockRescuer\n"
            "  def run\n"
            "    yield\n"
            "  rescue ArgumentError => e\n"
            "    'rescued: ' + e.message\n"
            "  end\n"
            "end\n"
            "BlockRescuer.new");
    auto res = call_with_block(rescuer.get(), "run", no_args,
            [&klass](const dyn_array<rooted_value>&) -> rooted_value {
                throw ruby_exception{
                    check_status(protect_exc_new(klass.get(), "bad arg"))};
            });
    BOOST_TEST((inspect(res.get()) == "\"rescued: bad arg\""));

    // exceptions from Ruby calls made by the block pass straight through
    try {
        call_with_block(arr.get(), "each", no_args,
                [](const dyn_array<rooted_value>&) {
                    return eval("raise IndexError, 'inner'");
                });
        BOOST_FAIL("exception not raised");
    } catch (const ruby_exception& e) {
        BOOST_TEST((vclass_name(e.exception()) == "IndexError"));
    }
}

BOOST_AUTO_TEST_CASE( block_host_exception_test ) {
    auto arr = eval("[1, 2]");
    try {
        call_with_block(arr.get(), "each", no_args,
                [](const dyn_array<rooted_value>&) -> rooted_value {
                    throw std::runtime_error{"boom"};
                });
        BOOST_FAIL("exception not raised");
    } catch (const ruby_exception& e) {
        BOOST_TEST((vclass_name(e.exception()) == "RuntimeError"));
        BOOST_TEST((e.message == "RuntimeError: boom"));
    }
    BOOST_TEST((last_error().has_value()));
    BOOST_TEST((*last_error() == "[ruby] RuntimeError: boom"));
}

BOOST_AUTO_TEST_CASE( block_jump_test ) {
    // throw inside the block unwinds through the protected call in the block
    // and on out to the enclosing catch
    auto main_obj = eval("self");
    dyn_array<rooted_value> args;
    args.push_back(eval(":garnet_tag"));
    bool after_throw = false;
    auto res = call_with_block(main_obj.get(), "catch", args,
            [&after_throw](const dyn_array<rooted_value>& args) -> rooted_value {
                BOOST_TEST((inspect(args[0].get()) == ":garnet_tag"));
                auto status = protect_eval("throw :garnet_tag, 5");
                BOOST_TEST((status.kind == status_jump));
                check_status(status);
                after_throw = true;
                return rooted_value{};
            });
    BOOST_TEST((!after_throw));
    BOOST_TEST((res.get() == vbox_long(5)));
}

BOOST_AUTO_TEST_CASE( nested_block_test ) {
    auto outer = eval("[1, 2]");
    auto inner = eval("[10, 20]");
    dyn_array<long> sums;
    call_with_block(outer.get(), "each", no_args,
            [&](const dyn_array<rooted_value>& a) {
                call_with_block(inner.get(), "each", no_args,
                        [&](const dyn_array<rooted_value>& b) {
                            sums.push_back(to_long(a[0].get()) + to_long(b[0].get()));
                            return rooted_value{};
                        });
                return rooted_value{};
            });
    BOOST_TEST((sums == (dyn_array<long>{11, 21, 12, 22})));
}

BOOST_AUTO_TEST_CASE( proc_block_test ) {
    auto arr = eval("[1, 2, 3]");
    auto inc = eval("proc { |x| x + 1 }");
    auto res = call_with_proc(arr.get(), "map", no_args, inc.get());
    BOOST_TEST((inspect(res.get()) == "[2, 3, 4]"));

    // private methods are reachable
    auto holder = eval(
            "class PrivateHolder\n"
            "  private def secret\n"
            "    yield 4\n"
            "  end\n"
            "end\n"
            "PrivateHolder.new");
    auto times_ten = eval("proc { |x| x * 10 }");
    res = call_with_proc(holder.get(), "secret", no_args, times_ten.get());
    BOOST_TEST((res.get() == vbox_long(40)));

    auto raising = eval("proc { |x| raise KeyError, 'in proc' if x == 2; x }");
    BOOST_CHECK_THROW(call_with_proc(arr.get(), "map", no_args, raising.get()),
            ruby_exception);
}

// The thunk complains instead of crashing on a bad signal or when no dispatcher
// is installed. This replaces the host dispatcher for good, so it must stay the
// last test case in the module.
static bool mangled_dispatch_called = false;
static void mangled_dispatch(void*, int, const rvalue*, rvalue, dispatch_signal* out) {
    mangled_dispatch_called = true;
    out->kind = (signal_kind)99;
    out->value = RV_NIL;
}

BOOST_AUTO_TEST_CASE( bad_signal_test ) {
    auto arr = eval("[1]");
    register_block_dispatcher(mangled_dispatch);
    auto status = protect_block_call(arr.get(), get_id("each"), 0, nullptr, nullptr);
    BOOST_TEST((mangled_dispatch_called));
    BOOST_TEST((status.kind == status_exception));
    BOOST_TEST((vclass_name(status.value) == "RuntimeError"));

    register_block_dispatcher(nullptr);
    status = protect_block_call(arr.get(), get_id("each"), 0, nullptr, nullptr);
    BOOST_TEST((status.kind == status_exception));
    BOOST_TEST((vclass_name(status.value) == "RuntimeError"));
}
