#include "refpool/refpool.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace {

// Immutable cons list; tails are shared between lists through PoolRef.
template <typename T>
struct Node {
  T value;
  refpool::PoolRef<Node<T> >* next;

  Node() : value(), next(NULL) {}
  Node(const Node& other) : value(other.value), next(NULL) {
    if (other.next != NULL) next = new refpool::PoolRef<Node<T> >(*other.next);
  }
  ~Node() { delete next; }

 private:
  Node& operator=(const Node&);
};

template <typename T>
class List {
 public:
  typedef refpool::PoolRef<Node<T> > Ref;

  explicit List(const refpool::Pool<Node<T> >& pool) : pool_(pool), head_(NULL), size_(0) {}
  List(const List& other) : pool_(other.pool_), head_(NULL), size_(other.size_) {
    if (other.head_ != NULL) head_ = new Ref(*other.head_);
  }
  ~List() { delete head_; }

  List& operator=(List other) {
    std::swap(head_, other.head_);
    std::swap(size_, other.size_);
    return *this;
  }

  List Cons(const T& value) const {
    Node<T> node;
    node.value = value;
    if (head_ != NULL) node.next = new Ref(*head_);
    List out(pool_);
    out.head_ = new Ref(Ref::New(pool_, std::move(node)));
    out.size_ = size_ + 1;
    return out;
  }

  std::size_t Size() const { return size_; }

  std::string ToString() const {
    std::string out = "[";
    const Ref* cur = head_;
    while (cur != NULL) {
      if (out.size() > 1) out += ", ";
      out += std::to_string((*cur)->value);
      cur = (*cur)->next;
    }
    return out + "]";
  }

 private:
  refpool::Pool<Node<T> > pool_;
  Ref* head_;
  std::size_t size_;
};

}  // namespace

int main(int argc, char* argv[]) {
  const std::string log_config = argc > 1 ? argv[1] : "";
  const std::string pool_config = argc > 2 ? argv[2] : "";

  refpool::log::ILogManager* logger = refpool_create_log_manager();
  if (logger == NULL) {
    std::fprintf(stderr, "create logger failed\n");
    return 1;
  }
  refpool::api::Status st = logger->Init(argv[0], log_config);
  if (!st.ok()) {
    std::fprintf(stderr, "Init failed: %s\n", st.ToString().c_str());
    refpool_destroy_log_manager(logger);
    return 1;
  }

  refpool::pool::PoolOptions options;
  options.capacity = 64;
  options.prefill = true;
  if (!pool_config.empty()) {
    refpool::api::Result<refpool::pool::PoolOptions> loaded =
        refpool::pool::LoadPoolOptions(pool_config);
    if (!loaded.ok()) {
      logger->Log(refpool::log::LogSeverity::kError, loaded.status().ToString());
      logger->Shutdown();
      refpool_destroy_log_manager(logger);
      return 1;
    }
    options = loaded.value();
  }

  {
    refpool::Pool<Node<int> > pool = refpool::pool::MakePool<Node<int> >(options);
    logger->Log(refpool::log::LogSeverity::kInfo,
                "created " + pool.DebugString() + " from " +
                    refpool::json::JsonCodec::Dump(refpool::pool::PoolOptionsToJson(options), -1));

    List<int> base(pool);
    for (int i = 0; i < 10; ++i) base = base.Cons(i);
    // Both lists share base's nodes.
    List<int> left = base.Cons(100);
    List<int> right = base.Cons(200);

    std::printf("base  %s\n", base.ToString().c_str());
    std::printf("left  %s\n", left.ToString().c_str());
    std::printf("right %s\n", right.ToString().c_str());
    std::printf("after building lists: %s\n", pool.DebugString().c_str());
  }

  logger->Log(refpool::log::LogSeverity::kInfo, "pool demo finished");
  logger->Shutdown();
  refpool_destroy_log_manager(logger);
  return 0;
}
