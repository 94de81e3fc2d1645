#include "engine/GameState.hh"

#include "Logging.hh"
#include "Utility.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace Coup {
namespace Engine {

namespace {

void validatePlayers(const PlayerInfoVector& players)
{
    const auto n_players = static_cast<int>(players.size());
    if (n_players < MIN_PLAYERS || n_players > MAX_PLAYERS) {
        throw std::invalid_argument {
            (boost::format("Invalid number of players: %d") % n_players).str()};
    }
    auto ids = std::set<PlayerId> {};
    for (const auto& info : players) {
        if (info.id.empty()) {
            throw std::invalid_argument {"Empty player id"};
        }
        if (!ids.insert(info.id).second) {
            throw std::invalid_argument {
                (boost::format("Duplicate player id: %s") % info.id).str()};
        }
    }
}

}

GameState::GameState(
    const PlayerInfoVector& players, Deck deck, const int logRetention) :
    deck(std::move(deck)),
    logRetention {logRetention}
{
    validatePlayers(players);
    if (logRetention <= 0) {
        throw std::invalid_argument {"Log retention must be positive"};
    }
    this->players.reserve(players.size());
    for (const auto& info : players) {
        auto& player = this->players.emplace_back(Player {info.id, info.name});
        for (auto& card : player.influence) {
            card = Card {drawOne(), false};
        }
    }
    appendLog(
        (boost::format("Game started. Each player has %d influence and %d coins.")
         % N_CARDS_PER_PLAYER % STARTING_COINS).str());
    if (const auto player = getCurrentPlayer()) {
        appendLog((boost::format("It is now %s's turn.") % *player).str());
    }
    log(LogLevel::DEBUG, "Game created with %d players", players.size());
}

const GameState::PlayerVector& GameState::getPlayers() const
{
    return players;
}

const Player* GameState::getPlayer(const PlayerId& playerId) const
{
    const auto iter = std::ranges::find(players, playerId, &Player::id);
    return iter != players.end() ? &(*iter) : nullptr;
}

Player* GameState::getPlayer(const PlayerId& playerId)
{
    const auto iter = std::ranges::find(players, playerId, &Player::id);
    return iter != players.end() ? &(*iter) : nullptr;
}

bool GameState::isAlive(const PlayerId& playerId) const
{
    const auto player = getPlayer(playerId);
    return player && Coup::isAlive(*player);
}

int GameState::getNumberOfAlivePlayers() const
{
    return static_cast<int>(
        std::ranges::count_if(
            players, [](const auto& player) { return Coup::isAlive(player); }));
}

bool GameState::playerHasRole(const PlayerId& playerId, const Role role) const
{
    const auto player = getPlayer(playerId);
    return player && holdsRole(*player, role);
}

const Player* GameState::getCurrentPlayer() const
{
    if (gameOver) {
        return nullptr;
    }
    const auto n_players = static_cast<int>(players.size());
    for (const auto n : to(n_players)) {
        const auto& player = players[(turnIndex + n) % n_players];
        if (Coup::isAlive(player)) {
            return &player;
        }
    }
    return nullptr;
}

void GameState::nextTurn()
{
    checkWin();
    if (gameOver) {
        return;
    }
    const auto n_players = static_cast<int>(players.size());
    for ([[maybe_unused]] const auto n : to(n_players)) {
        turnIndex = (turnIndex + 1) % n_players;
        if (Coup::isAlive(players[turnIndex])) {
            break;
        }
    }
    if (const auto player = getCurrentPlayer()) {
        appendLog((boost::format("It is now %s's turn.") % *player).str());
    }
}

void GameState::finishTurn()
{
    clearPendingAction();
    nextTurn();
}

void GameState::checkWin()
{
    if (gameOver || getNumberOfAlivePlayers() != 1) {
        return;
    }
    const auto iter = std::ranges::find_if(
        players, [](const auto& player) { return Coup::isAlive(player); });
    gameOver = true;
    winnerId = iter->id;
    appendLog((boost::format("%s wins!") % *iter).str());
    log(LogLevel::INFO, "Game over, winner: %s", iter->id);
}

bool GameState::isGameOver() const
{
    return gameOver;
}

const std::optional<PlayerId>& GameState::getWinnerId() const
{
    return winnerId;
}

Role GameState::drawOne()
{
    return deck.draw();
}

void GameState::returnToDeck(const std::vector<Role>& roles)
{
    deck.returnCards(roles);
}

bool GameState::revealAndRedraw(const PlayerId& playerId, const Role role)
{
    const auto player = getPlayer(playerId);
    if (!player) {
        return false;
    }
    const auto iter = std::ranges::find_if(
        player->influence,
        [role](const auto& card) { return !card.revealed && card.role == role; });
    if (iter == player->influence.end()) {
        return false;
    }
    appendLog((boost::format("%s reveals %s.") % *player % role).str());
    returnToDeck({role});
    *iter = Card {drawOne(), false};
    appendLog(
        (boost::format("%s draws a replacement influence.") % *player).str());
    return true;
}

bool GameState::loseInfluence(const PlayerId& playerId, const int cardIndex)
{
    const auto player = getPlayer(playerId);
    if (!player || cardIndex < 0 || cardIndex >= N_CARDS_PER_PLAYER) {
        return false;
    }
    auto& card = player->influence[cardIndex];
    if (card.revealed) {
        return false;
    }
    card.revealed = true;
    appendLog(
        (boost::format("%s loses influence (%s revealed).")
         % *player % card.role).str());
    checkWin();
    return true;
}

Responders GameState::makeRespondersExcept(const PlayerId& excludedId) const
{
    auto entries = Responders::EntryVector {};
    for (const auto& player : players) {
        if (player.id != excludedId && Coup::isAlive(player)) {
            entries.emplace_back(player.id, ResponseStatus::PENDING);
        }
    }
    return Responders {std::move(entries)};
}

const PendingAction* GameState::getPendingAction() const
{
    return pendingAction ? &(*pendingAction) : nullptr;
}

PendingAction* GameState::getPendingAction()
{
    return pendingAction ? &(*pendingAction) : nullptr;
}

void GameState::setPendingAction(PendingAction pendingAction)
{
    this->pendingAction = std::move(pendingAction);
}

void GameState::clearPendingAction()
{
    pendingAction.reset();
}

const ExchangeSecret* GameState::getExchangeSecret(
    const PlayerId& playerId) const
{
    const auto iter = exchangeSecrets.find(playerId);
    return iter != exchangeSecrets.end() ? &iter->second : nullptr;
}

void GameState::setExchangeSecret(
    const PlayerId& playerId, ExchangeSecret secret)
{
    exchangeSecrets.insert_or_assign(playerId, std::move(secret));
}

void GameState::eraseExchangeSecret(const PlayerId& playerId)
{
    exchangeSecrets.erase(playerId);
}

void GameState::appendLog(std::string entry)
{
    gameLog.push_back(std::move(entry));
    ++logCount;
    while (std::ssize(gameLog) > logRetention) {
        gameLog.pop_front();
    }
}

const std::deque<std::string>& GameState::getLog() const
{
    return gameLog;
}

long GameState::getLogCount() const
{
    return logCount;
}

const Deck& GameState::getDeck() const
{
    return deck;
}

GameView GameState::getViewFor(const std::optional<PlayerId>& viewerId) const
{
    auto view = GameView {};
    view.players.reserve(players.size());
    for (const auto& player : players) {
        auto& player_view = view.players.emplace_back(
            PlayerView {
                player.id, player.name, player.coins, Coup::isAlive(player),
                {}});
        const auto is_viewer = viewerId && *viewerId == player.id;
        for (const auto n : to(N_CARDS_PER_PLAYER)) {
            const auto& card = player.influence[n];
            if (card.revealed || is_viewer) {
                player_view.influence[n] = VisibleCard {card.role, card.revealed};
            } else {
                player_view.influence[n] = HiddenCard {};
            }
        }
    }
    view.log.assign(gameLog.begin(), gameLog.end());
    view.pendingAction = pendingAction;
    if (const auto player = getCurrentPlayer()) {
        view.turnPlayerId = player->id;
    }
    view.gameOver = gameOver;
    view.winnerId = winnerId;
    return view;
}

}
}
