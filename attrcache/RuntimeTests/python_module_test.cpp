// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include "attrcache/Jit/config.h"
#include "attrcache/RuntimeTests/fixtures.h"

using namespace attrcache;

class PythonModuleTest : public RuntimeTest {};

TEST_F(PythonModuleTest, SlotAttributeUpdates) {
  const char* src = R"(
P = _attrcache.make_type("P", slots=["x"])
p = P.new(x=10)
site = _attrcache.compile_guarded_access("f:1", "x")
assert site.call_site == "f:1"
assert site.name == "x"
assert site.state == "empty"
assert _attrcache.evaluate(site, p) == 10
assert site.state == "monomorphic"
p.set("x", 20)
assert _attrcache.evaluate(site, p) == 20
assert _attrcache.diagnostics(site)["miss_count"] == 1
assert _attrcache.compile_guarded_access("f:1", "x").state == "monomorphic"
)";
  runCode(src);
}

TEST_F(PythonModuleTest, ValuesRoundTripThroughTheObjectModel) {
  const char* src = R"(
V = _attrcache.make_type("V")
v = V.new(n=None, b=True, i=-3, f=1.5, s="text")
for name, expected in (("n", None), ("b", True), ("i", -3), ("f", 1.5), ("s", "text")):
    site = _attrcache.compile_guarded_access("values:" + name, name)
    got = _attrcache.evaluate(site, v)
    assert got == expected and type(got) is type(expected), (name, got)
    assert v.get(name) == expected
)";
  runCode(src);
}

TEST_F(PythonModuleTest, DataDescriptorInstalledAfterWarmup) {
  const char* src = R"(
C = _attrcache.make_type("C")
c = C.new(v=42)
site = _attrcache.compile_guarded_access("g:1", "v")
assert _attrcache.evaluate(site, c) == 42
assert _attrcache.evaluate(site, c) == 42

stored = []
D = _attrcache.make_descriptor_class(
    "D",
    lambda payload, obj: payload,
    lambda payload, obj, value: stored.append(value))
assert D.is_data
C.set_descriptor("v", D, 999)
assert _attrcache.evaluate(site, c) == 999
diag = _attrcache.diagnostics(site)
assert diag["respecialization_count"] == 1, diag
assert diag["state"] == "monomorphic", diag

c.set("v", 5)
assert stored == [5]
assert _attrcache.evaluate(site, c) == 999
)";
  runCode(src);
}

TEST_F(PythonModuleTest, RetypedDescriptorChangesPrecedence) {
  const char* src = R"(
N = _attrcache.make_descriptor_class("N", lambda payload, obj: payload)
D = _attrcache.make_descriptor_class(
    "D", lambda payload, obj: payload * 2, lambda payload, obj, value: None)
assert not N.is_data

C = _attrcache.make_type("C")
C.set_descriptor("w", N, 5)
c = C.new()
site = _attrcache.compile_guarded_access("retype:1", "w")
assert _attrcache.evaluate(site, c) == 5
c.set("w", 7)
assert _attrcache.evaluate(site, c) == 7
C.retype_descriptor("w", D)
assert _attrcache.evaluate(site, c) == 10
C.retype_descriptor("w", N)
assert _attrcache.evaluate(site, c) == 7

try:
    C.retype_descriptor("nothing", D)
except AttributeError:
    pass
else:
    raise AssertionError("expected AttributeError")
)";
  runCode(src);
}

TEST_F(PythonModuleTest, DescriptorGetterSeesTheInstance) {
  const char* src = R"(
Doubled = _attrcache.make_descriptor_class(
    "Doubled", lambda payload, obj: obj.get(payload) * 2)
C = _attrcache.make_type("C")
C.set_descriptor("twice", Doubled, "base")
c = C.new(base=21)
site = _attrcache.compile_guarded_access("getter:1", "twice")
assert _attrcache.evaluate(site, c) == 42
c.set("base", 4)
assert _attrcache.evaluate(site, c) == 8
)";
  runCode(src);
}

TEST_F(PythonModuleTest, FallbackHookResultsAreNotCached) {
  const char* src = R"(
calls = []
def missing(obj, name):
    calls.append(name)
    if name == "boom":
        raise KeyError(name)
    return name + "!"

F = _attrcache.make_type("F")
F.set_getattr(missing)
f = F.new()
site = _attrcache.compile_guarded_access("h:1", "dyn")
assert _attrcache.evaluate(site, f) == "dyn!"
assert _attrcache.evaluate(site, f) == "dyn!"
assert calls == ["dyn", "dyn"]
assert site.state == "empty"

boom = _attrcache.compile_guarded_access("h:2", "boom")
try:
    _attrcache.evaluate(boom, f)
except KeyError as e:
    assert e.args == ("boom",)
else:
    raise AssertionError("expected KeyError")

F.set_getattr(None)
try:
    _attrcache.evaluate(site, f)
except AttributeError:
    pass
else:
    raise AssertionError("expected AttributeError")
)";
  runCode(src);
}

TEST_F(PythonModuleTest, GetterAttributeErrorFallsBackToGetattr) {
  const char* src = R"(
Prop = _attrcache.make_descriptor_class(
    "Prop",
    lambda payload, obj: obj.get("_x"),
    lambda payload, obj, value: obj.set("_x", value))
T = _attrcache.make_type("T")
T.set_descriptor("x", Prop)
a = T.new(_x=1)
b = T.new()
site = _attrcache.compile_guarded_access("prop:1", "x")

try:
    _attrcache.evaluate(site, b)
except AttributeError as err:
    assert str(err) == "'T' object has no attribute '_x'", str(err)
else:
    raise AssertionError("expected AttributeError")

def only_x(obj, name):
    if name != "x":
        raise AttributeError(name)
    return 7
T.set_getattr(only_x)
assert b.get("x") == 7
assert _attrcache.evaluate(site, b) == 7
assert _attrcache.evaluate(site, a) == 1
assert site.state == "monomorphic"
assert _attrcache.evaluate(site, b) == 7
assert _attrcache.evaluate(site, a) == 1

def broken(payload, obj):
    raise KeyError("not an attribute error")
T.set_descriptor("y", _attrcache.make_descriptor_class("Broken", broken))
y_site = _attrcache.compile_guarded_access("prop:2", "y")
try:
    _attrcache.evaluate(y_site, a)
except KeyError:
    pass
else:
    raise AssertionError("expected KeyError")
)";
  runCode(src);
}

TEST_F(PythonModuleTest, GetAttributeOverridesEverything) {
  const char* src = R"(
G = _attrcache.make_type("G", slots=["x"])
g = G.new(x=1)
site = _attrcache.compile_guarded_access("ga:1", "x")
assert _attrcache.evaluate(site, g) == 1
G.set_getattribute(lambda obj, name: "override")
assert _attrcache.evaluate(site, g) == "override"
assert g.get("x") == "override"
G.set_getattribute(None)
assert _attrcache.evaluate(site, g) == 1
)";
  runCode(src);
}

TEST_F(PythonModuleTest, ErrorsMapToPythonExceptions) {
  const char* src = R"(
E = _attrcache.make_type("E", slots=["a"])
C = _attrcache.make_type("C")
e = E.new()
site = _attrcache.compile_guarded_access("err:1", "a")

def raises(exc, func, *args):
    try:
        func(*args)
    except exc as err:
        return str(err)
    raise AssertionError(f"expected {exc.__name__}")

msg = raises(AttributeError, _attrcache.evaluate, site, e)
assert msg == "'E' object has no attribute 'a'", msg
assert "no attribute 'zzz'" in raises(AttributeError, e.get, "zzz")
raises(AttributeError, E.del_attr, "zzz")

raises(ValueError, e.set_class, C)
raises(ValueError, _attrcache.make_type, "Dup", (E, E))
raises(ValueError, _attrcache.compile_guarded_access, "err:1", "b")
raises(ValueError, E.set_bases, (E,))

raises(TypeError, C.new().set, "q", [1])
raises(TypeError, _attrcache.evaluate, site, 5)
raises(TypeError, _attrcache.evaluate, e, e)
raises(TypeError, E.set_bases, [C])
raises(TypeError, C.new().set_dict, 3)
raises(TypeError, _attrcache.HostType)
)";
  runCode(src);
}

TEST_F(PythonModuleTest, ClassAndDictReassignment) {
  const char* src = R"(
A = _attrcache.make_type("A")
B = _attrcache.make_type("B")
A.set_attr("kind", "a")
B.set_attr("kind", "b")
o = A.new()
site = _attrcache.compile_guarded_access("reassign:1", "kind")
assert _attrcache.evaluate(site, o) == "a"
o.set_class(B)
assert o.type == B
assert _attrcache.evaluate(site, o) == "b"
o.set_dict({"kind": "own"})
assert _attrcache.evaluate(site, o) == "own"
o.delete("kind")
assert _attrcache.evaluate(site, o) == "b"
)";
  runCode(src);
}

TEST_F(PythonModuleTest, BaseMutationPropagates) {
  const char* src = R"(
Base = _attrcache.make_type("Base")
Other = _attrcache.make_type("Other")
Sub = _attrcache.make_type("Sub", (Base,))
assert Sub.mro == (Sub, Base)
Base.set_attr("greeting", "hi")
Other.set_attr("greeting", "hey")
s = Sub.new()
site = _attrcache.compile_guarded_access("base:1", "greeting")
assert _attrcache.evaluate(site, s) == "hi"
before = Sub.version_tag
Base.set_attr("greeting", "hello")
assert Sub.version_tag != before
assert _attrcache.evaluate(site, s) == "hello"
Sub.set_bases((Other,))
assert Sub.mro == (Sub, Other)
assert _attrcache.evaluate(site, s) == "hey"
)";
  runCode(src);
}

TEST_F(PythonModuleTest, ExhaustedVersionTagIsNeverCached) {
  const char* src = R"(
X = _attrcache.make_type("X")
X.set_attr("k", 1)
x = X.new()
site = _attrcache.compile_guarded_access("pin:1", "k")
assert _attrcache.evaluate(site, x) == 1
assert X.version_tag != 0
_attrcache.exhaust_version_tag(X)
assert X.version_tag == 0
X.set_attr("k", 2)
assert X.version_tag == 0
assert _attrcache.evaluate(site, x) == 2
assert _attrcache.evaluate(site, x) == 2
assert _attrcache.diagnostics(site)["miss_count"] == 3
)";
  runCode(src);
}

TEST_F(PythonModuleTest, InvalidateTypeChangesTheTag) {
  const char* src = R"(
T = _attrcache.make_type("T")
Sub = _attrcache.make_type("Sub", (T,))
T.set_attr("a", 1)
t = Sub.new()
site = _attrcache.compile_guarded_access("inv:1", "a")
assert _attrcache.evaluate(site, t) == 1
before = (T.version_tag, Sub.version_tag)
generation = T.generation
_attrcache.invalidate_type(T)
assert T.version_tag != before[0]
assert Sub.version_tag != before[1]
assert T.generation == generation
assert _attrcache.evaluate(site, t) == 1
assert _attrcache.diagnostics(site)["miss_count"] == 2
)";
  runCode(src);
}

TEST_F(PythonModuleTest, ManyDynamicTypesStayCorrect) {
  const char* src = R"(
types = [_attrcache.make_type(f"T{i}") for i in range(20)]
for i, t in enumerate(types):
    t.set_attr("val", i)
objs = [t.new() for t in types]
site = _attrcache.compile_guarded_access("poly:1", "val")
for _ in range(2):
    for i, o in enumerate(objs):
        assert _attrcache.evaluate(site, o) == i
for i, o in reversed(list(enumerate(objs))):
    assert _attrcache.evaluate(site, o) == i
diag = _attrcache.diagnostics(site)
assert diag["state"] == "polymorphic", diag
assert diag["entry_count"] == 4, diag
assert diag["eviction_count"] > 0, diag
)";
  runCode(src);
}

TEST_F(PythonModuleTest, CacheStatsReportMissReasons) {
  getMutableConfig().collect_attr_cache_stats = true;
  const char* src = R"(
A = _attrcache.make_type("A", slots=["x"])
B = _attrcache.make_type("B", slots=["x"])
a = A.new(x=1)
b = B.new()
site = _attrcache.compile_guarded_access("stats:1", "x")
assert _attrcache.evaluate(site, a) == 1
assert _attrcache.evaluate(site, a) == 1
for _ in range(2):
    try:
        _attrcache.evaluate(site, b)
    except AttributeError:
        pass

stats = _attrcache.get_and_clear_cache_stats()
assert len(stats) == 1, stats
entry = stats[0]
assert entry["call_site"] == "stats:1"
assert entry["attr_name"] == "x"
assert entry["misses"] == {
    "A.x": {"count": 1, "reason": "Empty"},
    "B.x": {"count": 2, "reason": "AttributeNotFound"},
}, entry
assert _attrcache.get_and_clear_cache_stats() == []
)";
  runCode(src);
}

TEST_F(PythonModuleTest, NoCacheStatsByDefault) {
  const char* src = R"(
A = _attrcache.make_type("A")
a = A.new()
site = _attrcache.compile_guarded_access("nostats:1", "x")
try:
    _attrcache.evaluate(site, a)
except AttributeError:
    pass
assert _attrcache.get_and_clear_cache_stats() == []
assert _attrcache.is_enabled()
)";
  runCode(src);
}

TEST_F(PythonModuleTest, DisabledCachesStillAnswer) {
  getMutableConfig().attr_caches = false;
  const char* src = R"(
assert not _attrcache.is_enabled()
A = _attrcache.make_type("A", slots=["x"])
a = A.new(x=3)
site = _attrcache.compile_guarded_access("off:1", "x")
assert _attrcache.evaluate(site, a) == 3
assert _attrcache.evaluate(site, a) == 3
assert site.state == "empty"
assert _attrcache.diagnostics(site)["miss_count"] == 2
)";
  runCode(src);
}

// Starts an interpreter without importing _attrcache, so a test can prepare
// sys._xoptions first.
class XOptionsImportTest : public ::testing::Test {
 public:
  void SetUp() override {
    ASSERT_FALSE(isInitialized());
    Py_Initialize();
  }

  void TearDown() override {
    ASSERT_EQ(Py_FinalizeEx(), 0);
    EXPECT_FALSE(isInitialized());
  }
};

TEST_F(XOptionsImportTest, UndecodableOptionsAreSkipped) {
  ASSERT_EQ(
      PyRun_SimpleString("import sys\n"
                         "sys._xoptions['attrcache-\\udcff'] = True\n"
                         "sys._xoptions['attrcache-stats'] = '\\udcff'\n"
                         "sys._xoptions['attrcache-size'] = '7'\n"),
      0);

  testing::internal::CaptureStderr();
  auto module = Ref<>::steal(PyImport_ImportModule("_attrcache"));
  std::string output = testing::internal::GetCapturedStderr();
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(PyErr_Occurred(), nullptr);
  EXPECT_TRUE(isInitialized());
  EXPECT_EQ(getConfig().attr_cache_size, 7);
  EXPECT_FALSE(getConfig().collect_attr_cache_stats);
  EXPECT_NE(
      output.find("ignoring X-option attrcache-stats"), std::string::npos);
}
