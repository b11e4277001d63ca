#include "test_common.h"
#include "cordon/capability.h"
#include "cordon/script/interpreter.h"

using namespace cordon;
using namespace cordon::script;

struct Run {
    ScriptOutcome oc;
    std::string out;
    std::string err;
};

static Run run(const std::string& src, const std::string& stdin_data = "", bool echo = true, int depth = 200) {
    StringSink o, e;
    InterpreterOptions opts;
    opts.stdin_data = stdin_data;
    opts.echo_prompt = echo;
    opts.max_call_depth = depth;
    Run r;
    r.oc = run_script(src, CapabilityPolicy::pure_default(), o, e, opts);
    r.out = o.str();
    r.err = e.str();
    return r;
}

static void expect_output(const std::string& src, const std::string& want, const std::string& what) {
    Run r = run(src);
    if (r.oc.kind != RunKind::OK) {
        die(what + ": expected ok, got " + runkind_to_str(r.oc.kind) + " " + r.oc.error_type + ": " + r.oc.message);
    }
    expect_eq_str(r.out, want, what);
}

static void expect_fault(const std::string& src, const std::string& type, int line, const std::string& what) {
    Run r = run(src);
    expect_true(r.oc.kind == RunKind::RUNTIME_FAULT, what + ": expected runtime_fault, got " + runkind_to_str(r.oc.kind));
    expect_eq_str(r.oc.error_type, type, what + " type");
    if (line > 0) expect_eq_ll(r.oc.line, line, what + " line");
}

int main() {
    // Basics
    expect_output("print('Hello, World!')\n", "Hello, World!\n", "hello");
    expect_output("print(1, 2, 3, sep='-', end='!\\n')\n", "1-2-3!\n", "print sep/end");
    expect_output("print()\n", "\n", "empty print");
    expect_output("x = 7\ny = 2\nprint(x // y, x % y, x / y, x ** y, -x // y)\n", "3 1 3.5 49 -4\n", "int arithmetic");
    expect_output("print(0.1 + 0.2, 1e20, 2.0, 1/3)\n", "0.30000000000000004 1e+20 2.0 0.3333333333333333\n", "float repr");
    expect_output("print(True + 1, None, 3 == 3.0, 'a' < 'b')\n", "2 None True True\n", "bool and compare");
    expect_output("print(7 & 3, 7 | 8, 7 ^ 2, 1 << 4, -16 >> 2, ~5)\n", "3 15 5 16 -4 -6\n", "bitwise");
    expect_output("print(-7 % 3, 7 % -3, divmod(-7, 2))\n", "2 -2 (-4, 1)\n", "modulo sign follows divisor");
    expect_output("a = b = 5\na, b = b + 1, a\nprint(a, b)\n", "6 5\n", "chained and tuple assignment");
    expect_output("first, *rest = [1, 2, 3]\nprint(first, rest)\n", "1 [2, 3]\n", "starred unpacking");

    // Control flow
    expect_output("for i in range(3):\n    if i == 1:\n        continue\n    print(i)\nelse:\n    print('done')\n",
                  "0\n2\ndone\n", "for/continue/else");
    expect_output("n = 0\nwhile True:\n    n += 1\n    if n > 3:\n        break\nelse:\n    print('no')\nprint(n)\n",
                  "4\n", "while/break skips else");
    expect_output("x = 5\nprint('big' if x > 3 else 'small')\n", "big\n", "conditional expression");
    expect_output("print(1 < 2 < 3, 1 < 3 < 2, 0 or 'x', 0 and 'x')\n", "True False x 0\n", "chains and short circuit");

    // Functions and scopes
    expect_output("def f(a, b=10, *rest):\n    return a + b + sum(rest)\nprint(f(1), f(1, 2), f(1, 2, 3, 4), f(b=1, a=2))\n",
                  "11 3 10 3\n", "defaults, *args, keywords");
    expect_output("def outer():\n    n = 0\n    def inc():\n        nonlocal n\n        n += 1\n        return n\n    inc()\n    return inc()\nprint(outer())\n",
                  "2\n", "closure with nonlocal");
    expect_output("count = 0\ndef bump():\n    global count\n    count += 1\nbump()\nbump()\nprint(count)\n", "2\n", "global");
    expect_output("sq = lambda x: x * x\nprint(list(map(sq, [1, 2, 3])))\n", "[1, 4, 9]\n", "lambda and map");
    expect_output("def fact(n):\n    return 1 if n <= 1 else n * fact(n - 1)\nprint(fact(20))\n", "2432902008176640000\n", "recursion");

    // Collections
    expect_output("xs = [3, 1, 2]\nxs.append(5)\nxs.sort()\nprint(xs, xs[-1], xs[1:3], xs[::-1], len(xs))\n",
                  "[1, 2, 3, 5] 5 [2, 3] [5, 3, 2, 1] 4\n", "list ops");
    expect_output("d = {'b': 2, 'a': 1}\nd['c'] = 3\nprint(d, list(d.keys()), d.get('z', 0))\nfor k, v in d.items():\n    print(k, v)\n",
                  "{'b': 2, 'a': 1, 'c': 3} ['b', 'a', 'c'] 0\nb 2\na 1\nc 3\n", "dict insertion order");
    expect_output("t = (1, 'two', 3.0)\nprint(t, t[1], (5,), ())\n", "(1, 'two', 3.0) two (5,) ()\n", "tuple repr");
    expect_output("print([x * x for x in range(5) if x % 2 == 0])\nprint({k: len(k) for k in ['a', 'bb']})\n",
                  "[0, 4, 16]\n{'a': 1, 'bb': 2}\n", "comprehensions");
    expect_output("print(sum(x for x in range(4)), any(x > 2 for x in [1, 3]), all([]))\n", "6 True True\n", "generator arguments");
    expect_output("print(sorted(['bb', 'a', 'ccc'], key=len, reverse=True))\n", "['ccc', 'bb', 'a']\n", "sorted key reverse");
    expect_output("print(list(enumerate('ab', 1)), list(zip([1, 2], 'xy')))\n", "[(1, 'a'), (2, 'b')] [(1, 'x'), (2, 'y')]\n", "enumerate zip");
    expect_output("print(min(3, 1, 2), max([4, 9, 2]), max([], default=-1), min(['aa', 'b'], key=len))\n", "1 9 -1 b\n", "min max");
    expect_output("xs = [1, 2, 3]\ndel xs[0]\nprint(xs, 2 in xs, 5 not in xs)\n", "[2, 3] True True\n", "del and membership");
    expect_output("print(list(range(10, 0, -3)), list(reversed([1, 2, 3])))\n", "[10, 7, 4, 1] [3, 2, 1]\n", "range and reversed");

    // Strings
    expect_output("s = '  Hello World  '\nprint(s.strip().lower(), s.split(), '-'.join(['a', 'b']), 'abc'.upper())\n",
                  "hello world ['Hello', 'World'] a-b ABC\n", "string methods");
    expect_output("print('a,b,,c'.split(','), 'hello'.replace('l', 'L', 1), 'abc'.find('c'), 'x'.center(5, '*'))\n",
                  "['a', 'b', '', 'c'] heLlo 2 **x**\n", "more string methods");
    expect_output("print('hello world'.title(), '42'.zfill(5), 'abc'[1], 'abc'[-1], 'hello'[1:4])\n",
                  "Hello World 00042 b c ell\n", "title zfill index slice");
    expect_output("print(repr('it\\'s'), str(3.0), int('  -12 '), float('2.5'), int('ff', 16))\n",
                  "\"it's\" 3.0 -12 2.5 255\n", "conversions");
    expect_output("print(ord('A'), chr(97), hex(255), bin(5), oct(8), len('héllo'))\n", "65 a 0xff 0b101 0o10 5\n", "ord chr bases utf8");
    expect_output("name = 'Ada'\nn = 3.14159\nprint(f'{name!r} {n:.2f} {n:8.3f}|{42:>5}|{42:<5}|{42:^5}|{1234567:,}')\n",
                  "'Ada' 3.14    3.142|   42|42   | 42  |1,234,567\n", "f-strings");
    expect_output("print('{} + {} = {}'.format(1, 2, 3), '{0}{1}{0}'.format('a', 'b'), '{x}'.format(x=5))\n",
                  "1 + 2 = 3 aba 5\n", "str.format");
    expect_output("print('%s has %d items (%.1f%%)' % ('cart', 3, 42.25))\n", "cart has 3 items (42.2%)\n", "percent format");
    expect_output("print(format(0.5, '%'), format(255, '08b'), format(3, '+d'))\n", "50.000000% 11111111 +3\n", "format builtin");
    expect_output("print(round(2.5), round(3.5), round(2.675, 2), round(-0.5))\n", "2 4 2.67 0\n", "banker's rounding");

    // Modules
    expect_output("import math\nprint(math.sqrt(16), math.floor(2.7), math.gcd(12, 18), math.factorial(5), math.pi)\n",
                  "4.0 2 6 120 3.141592653589793\n", "math module");
    expect_output("from math import ceil as c, isqrt\nprint(c(1.2), isqrt(17))\n", "2 4\n", "from import as");
    expect_output("import string\nprint(string.digits, len(string.ascii_letters))\n", "0123456789 52\n", "string module");
    expect_fault("import math\nmath.sqrt(-1)\n", "ValueError", 2, "math domain error");

    // Exceptions
    expect_output("try:\n    1 / 0\nexcept ZeroDivisionError as e:\n    print('caught', e)\nelse:\n    print('no')\nfinally:\n    print('fin')\n",
                  "caught division by zero\nfin\n", "try/except/finally");
    expect_output("try:\n    [][1]\nexcept LookupError:\n    print('lookup')\n", "lookup\n", "exception hierarchy");
    expect_output("try:\n    raise ValueError('bad')\nexcept (TypeError, ValueError) as e:\n    print('tuple', e)\n",
                  "tuple bad\n", "tuple of handlers");
    expect_output("def f():\n    try:\n        return 1\n    finally:\n        print('cleanup')\nprint(f())\n", "cleanup\n1\n", "finally on return");
    expect_output("try:\n    try:\n        raise KeyError('k')\n    except KeyError:\n        raise\nexcept Exception as e:\n    print(repr(e))\n",
                  "KeyError('k')\n", "bare re-raise");
    expect_output("print(isinstance(3, int), isinstance(True, int), isinstance('x', (int, str)), type(2.0) == float)\n",
                  "True True True True\n", "isinstance and type");

    // Arbitrary-precision integers and the rest of the language
    expect_output("print(2 ** 100)\n", "1267650600228229401496703205376\n", "big power");
    expect_output("print(99999999999999999999 + 1)\n", "100000000000000000000\n", "big literal");
    expect_output("import math\nprint(math.factorial(21))\n", "51090942171709440000\n", "math.factorial past 64 bits");
    expect_output("def f(n):\n    return 1 if n <= 1 else n * f(n - 1)\nprint(f(25))\n",
                  "15511210043330985984000000\n", "recursive factorial past 64 bits");
    expect_output("print(pow(3, -1, 7), pow(2, 10, 1000), pow(2, -1))\n", "5 24 0.5\n", "pow with modulus and inverse");
    expect_output("print(set([1, 2, 2]), sorted({3, 1} | {2}), frozenset() == set())\n", "{1, 2} [1, 2, 3] True\n",
                  "sets");
    expect_output("class A:\n    pass\nprint(type(A()).__name__)\n", "A\n", "empty class");
    expect_output("class Animal:\n    def __init__(self, name):\n        self.name = name\n    def __str__(self):\n"
                  "        return 'animal ' + self.name\nclass Dog(Animal):\n    def __init__(self, name):\n"
                  "        super().__init__(name.title())\nprint(Dog('rex'), isinstance(Dog('a'), Animal))\n",
                  "animal Rex True\n", "inheritance with super().__init__");
    expect_output("def gen(n):\n    for i in range(n):\n        yield i * i\nprint(list(gen(4)))\n", "[0, 1, 4, 9]\n",
                  "generators");
    expect_output("with_walrus = [y for x in range(4) if (y := x * 2) > 2]\nprint(with_walrus)\n", "[4, 6]\n", "walrus");
    expect_output("print('\\N{GREEK SMALL LETTER ALPHA}', 'caf\\u00e9'.upper())\n", "\xce\xb1 CAF\xc3\x89\n",
                  "named escapes and unicode");
    expect_output("raise SystemExit\n", "", "SystemExit without a code ends normally");
    expect_fault("raise SystemExit(3)\n", "SystemExit", 1, "SystemExit with a code");

    // Uncaught faults: one sanitized line on stderr, status carries type and line
    {
        Run r = run("x = 1\ny = [1, 2]\nprint(y[5])\n");
        expect_true(r.oc.kind == RunKind::RUNTIME_FAULT, "index error is a fault");
        expect_eq_str(r.oc.error_type, "IndexError", "IndexError type");
        expect_eq_ll(r.oc.line, 3, "IndexError line");
        expect_eq_str(r.err, "IndexError: list index out of range (line 3)\n", "stderr fault line");
    }
    expect_fault("print(undefined)\n", "NameError", 1, "NameError");
    expect_fault("x = {'a': 1}\nx['b']\n", "KeyError", 2, "KeyError");
    expect_fault("'a' + 1\n", "TypeError", 1, "TypeError");
    expect_fault("int('abc')\n", "ValueError", 1, "ValueError");
    expect_fault("assert 1 == 2, 'nope'\n", "AssertionError", 1, "AssertionError");
    expect_fault("1.0 * 10 ** 400\n", "OverflowError", 1, "float overflow raises");
    expect_fault("def f(n):\n    return f(n + 1)\nf(0)\n", "RecursionError", 0, "recursion bound");
    expect_fault("raise RuntimeError('boom')\n", "RuntimeError", 1, "explicit raise");
    expect_fault("def f():\n    print(v)\n    v = 1\nf()\n", "UnboundLocalError", 2, "unbound local");

    // Syntax errors never execute anything
    {
        Run r = run("print('first')\nif True\n    print('x')\n");
        expect_true(r.oc.kind == RunKind::SYNTAX_ERROR, "syntax error kind");
        expect_eq_ll(r.oc.line, 2, "syntax error line");
        expect_eq_str(r.out, "", "nothing executed");
        expect_true(r.err.rfind("SyntaxError: ", 0) == 0, "stderr starts with SyntaxError");
    }

    // input(): prompt echo, line reads, EOF
    {
        Run r = run("name = input('Name? ')\nprint('Hello, ' + name + '!')\n", "Alice\n");
        expect_eq_str(r.out, "Name? Hello, Alice!\n", "prompt echoed");
        r = run("name = input('Name? ')\nprint('Hello, ' + name + '!')\n", "Alice", false);
        expect_eq_str(r.out, "Hello, Alice!\n", "prompt suppressed, no trailing newline in stdin");
        r = run("a = int(input())\nb = int(input())\nprint(a + b)\n", "4\n5\n");
        expect_eq_str(r.out, "9\n", "two lines");
        r = run("input()\ninput()\n", "only\n");
        expect_true(r.oc.kind == RunKind::RUNTIME_FAULT && r.oc.error_type == "EOFError", "EOF raises EOFError");
        expect_eq_ll(r.oc.line, 2, "EOFError line");
        r = run("try:\n    input()\nexcept EOFError:\n    print('eof')\n", "");
        expect_eq_str(r.out, "eof\n", "EOFError catchable");
    }

    // Call depth follows the configured bound
    {
        Run r = run("def f(n):\n    return 0 if n == 0 else 1 + f(n - 1)\nprint(f(40))\n", "", true, 30);
        expect_true(r.oc.kind == RunKind::RUNTIME_FAULT && r.oc.error_type == "RecursionError", "depth 30 exceeded");
        r = run("def f(n):\n    return 0 if n == 0 else 1 + f(n - 1)\nprint(f(40))\n", "", true, 100);
        expect_eq_str(r.out, "40\n", "depth 100 suffices");
    }

    // A program cannot hold on to a denial: handlers after it never complete
    {
        Run r = run("try:\n    __builtins__['open']('/etc/passwd')\nexcept BaseException:\n    print('caught')\n"
                    "finally:\n    print('finally')\nprint('after')\n");
        expect_true(r.oc.kind == RunKind::SECURITY_VIOLATION, "looked-up open is a violation");
        expect_eq_str(r.oc.message, "capability 'open' not permitted", "violation names open");
        expect_eq_ll(r.oc.line, 2, "violation line");
        expect_eq_str(r.out, "", "handlers never ran");
        expect_eq_str(r.err, "", "nothing written for a violation");

        r = run("f = __builtins__['__import__']\ntry:\n    f('os')\nexcept Exception:\n    pass\n");
        expect_true(r.oc.kind == RunKind::SECURITY_VIOLATION, "dynamic import is a violation");
        expect_eq_str(r.oc.message, "capability 'os' not permitted", "violation names os");
    }

    // Null bytes cannot reach the compiler
    {
        Run r = run(std::string("x = 1\ny = '") + '\0' + "'\n");
        expect_true(r.oc.kind == RunKind::SYNTAX_ERROR, "null byte is a syntax error");
        expect_eq_ll(r.oc.line, 2, "null byte line");
    }

    // Each run gets its own copy of a module
    {
        Run a = run("import math\nmath.pi = 3\nprint(math.pi)\n");
        expect_eq_str(a.out, "3\n", "module attribute rebound");
        Run b = run("from math import pi\nprint(pi)\n");
        expect_eq_str(b.out, "3.141592653589793\n", "next run sees the original module");
    }

    // Compiling and running are separate steps
    {
        StringSink o, e;
        CompiledProgram prog;
        ScriptOutcome oc = compile_script("x = (1,\n", CapabilityPolicy::pure_default(), e, &prog);
        expect_true(oc.kind == RunKind::SYNTAX_ERROR, "compile reports the syntax error");
        expect_true(!prog.ready(), "nothing to run");
        expect_true(e.str().rfind("SyntaxError: ", 0) == 0, "fault line written at compile time");

        CompiledProgram denied;
        oc = compile_script("import os\n", CapabilityPolicy::pure_default(), e, &denied);
        expect_true(oc.kind == RunKind::SECURITY_VIOLATION, "compile applies the pre-scan");
        expect_true(!denied.ready(), "denied program is not runnable");

        CompiledProgram ok;
        oc = compile_script("print(input() * 2)\n", CapabilityPolicy::pure_default(), e, &ok);
        expect_true(oc.kind == RunKind::OK && ok.ready(), "clean program compiles");
        InterpreterOptions opts;
        opts.stdin_data = "ab\n";
        oc = run_compiled(ok, CapabilityPolicy::pure_default(), o, e, opts);
        expect_true(oc.kind == RunKind::OK, "compiled program runs");
        expect_eq_str(o.str(), "abab\n", "compiled program output");
    }

    // Reference cycles left by a program are collected before the run ends
    {
        Run r = run("class Node:\n    def __del__(self):\n        print('freed')\n"
                    "a = Node()\nb = Node()\na.peer = b\nb.peer = a\n"
                    "def outer():\n    def inner():\n        return inner\n    return inner\nkeep = outer()\n");
        expect_true(r.oc.kind == RunKind::OK, "cycles run ok");
        expect_eq_str(r.out, "freed\nfreed\n", "finalizers ran inside the run");
    }

    // Each run starts from a fresh namespace
    {
        Run a = run("shared = 1\n");
        expect_true(a.oc.kind == RunKind::OK, "first run ok");
        Run b = run("print(shared)\n");
        expect_true(b.oc.kind == RunKind::RUNTIME_FAULT && b.oc.error_type == "NameError", "no state leaks between runs");
    }

    std::cerr << "test_interpreter: ALL PASSED" << std::endl;
    return 0;
}
