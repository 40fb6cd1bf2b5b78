// RouterNode.cpp
#include "RouterNode.hpp"

RouterNode::RouterNode(const std::string &name, const std::string &host, int port)
    : name(name), host(host), port(port) {}

RouterNode::~RouterNode()
{
    signalShutdown();
    joinListener();
}

const std::string &RouterNode::getName() const
{
    return name;
}

const std::string &RouterNode::getHost() const
{
    return host;
}

int RouterNode::getPort() const
{
    return port.load();
}

void RouterNode::setPort(int newPort)
{
    port.store(newPort);
}

void RouterNode::addEdge(const std::string &destination, double weight)
{
    std::lock_guard<std::mutex> lock(edgeMutex);
    edges.push_back(Edge{name, destination, weight});
}

bool RouterNode::setEdgeWeight(const std::string &destination, double weight)
{
    std::lock_guard<std::mutex> lock(edgeMutex);
    for (auto &edge : edges)
    {
        if (edge.destination == destination)
        {
            edge.weight = weight;
            return true;
        }
    }
    return false;
}

std::vector<Edge> RouterNode::getEdges() const
{
    std::lock_guard<std::mutex> lock(edgeMutex);
    return edges;
}

double RouterNode::edgeWeight(const std::string &destination) const
{
    std::lock_guard<std::mutex> lock(edgeMutex);
    for (const auto &edge : edges)
    {
        if (edge.destination == destination)
            return edge.weight;
    }
    return INFINITE_COST;
}

DistanceTable RouterNode::getTable() const
{
    std::lock_guard<std::mutex> lock(tableMutex);
    return table;
}

void RouterNode::setTable(const DistanceTable &newTable)
{
    std::lock_guard<std::mutex> lock(tableMutex);
    table = newTable;
}

bool RouterNode::setTableCost(const std::string &destination, double cost)
{
    std::lock_guard<std::mutex> lock(tableMutex);
    for (auto &entry : table)
    {
        if (entry.source == name && entry.destination == destination)
        {
            entry.cost = cost;
            return true;
        }
    }
    return false;
}

void RouterNode::deliver(const DistanceTable &advertisement)
{
    std::lock_guard<std::mutex> lock(mailboxMutex);
    mailbox.push_back(advertisement);
}

std::vector<DistanceTable> RouterNode::takeMailbox(bool drain)
{
    std::lock_guard<std::mutex> lock(mailboxMutex);
    if (!drain)
        return mailbox;

    std::vector<DistanceTable> received;
    received.swap(mailbox);
    return received;
}

size_t RouterNode::mailboxSize() const
{
    std::lock_guard<std::mutex> lock(mailboxMutex);
    return mailbox.size();
}

void RouterNode::startListener(std::function<void()> body)
{
    shutdown.store(false);
    listenerThread = std::thread(std::move(body));
}

void RouterNode::signalShutdown()
{
    shutdown.store(true);
}

bool RouterNode::shutdownRequested() const
{
    return shutdown.load();
}

void RouterNode::joinListener()
{
    if (listenerThread.joinable())
    {
        listenerThread.join();
    }
}

bool RouterNode::listenerRunning() const
{
    return listenerThread.joinable();
}
